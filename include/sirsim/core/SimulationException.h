#pragma once

#include "Errors.h"
#include <stdexcept>
#include <string>

class SimulationException : public std::runtime_error
{
public:
    // agent_index is the offending agent, or -1 when the error is not tied to one
    SimulationException(SimErrc code, const std::string &message, long agent_index = -1)
        : std::runtime_error(format_message(agent_index, message)),
          m_code(code),
          m_agent_index(agent_index)
    {
    }

    SimErrc code() const noexcept { return m_code; }
    long agent_index() const noexcept { return m_agent_index; }

private:
    SimErrc m_code;
    long m_agent_index;

    static std::string format_message(long agent_index, const std::string &message)
    {
        if (agent_index >= 0)
        {
            return "Agent " + std::to_string(agent_index) + ": " + message;
        }
        return message;
    }
};
