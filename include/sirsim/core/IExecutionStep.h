#pragma once

#include "include/sirsim/core/DataStructures.h"
#include <cstddef>
#include <vector>

// Mutable state of one run, owned by a SimulationEngine and handed to each
// execution step in turn.
struct RunState
{
    std::vector<Vec2> positions;
    std::vector<Vec2> velocities;
    std::vector<HealthState> states;
    std::vector<double> infection_times;
    StateCounts counts;
    double current_time = 0.0;

    // Agents that were Infected when the current step began, in index order.
    std::vector<size_t> infected_at_step_start;
};

class IExecutionStep
{
public:
    virtual ~IExecutionStep() = default;

    virtual void execute(RunState &state, RandomEngine &rng) const = 0;
};
