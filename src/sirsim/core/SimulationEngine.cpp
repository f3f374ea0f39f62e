#include "include/sirsim/core/SimulationEngine.h"
#include "include/sirsim/core/ExecutionSteps.h"
#include "include/sirsim/core/InitialConfiguration.h"
#include "include/sirsim/core/SimulationException.h"

#include <string>
#include <utility>

SimulationEngine::SimulationEngine(const RunConfig &config, RandomEngine rng)
    : m_config(config), m_rng(std::move(rng)), m_steps_taken(0)
{
    validate_run_config(m_config);
    load_initial_configuration(generate_initial_configuration(m_config, m_rng));
}

SimulationEngine::SimulationEngine(const RunConfig &config, InitialConfiguration initial, RandomEngine rng)
    : m_config(config), m_rng(std::move(rng)), m_steps_taken(0)
{
    validate_run_config(m_config);
    load_initial_configuration(std::move(initial));
}

void SimulationEngine::build_step_pipeline()
{
    m_per_step_phases.clear();
    m_per_step_phases.push_back(std::make_unique<MotionIntegrationStep>(m_config.dt));
    m_per_step_phases.push_back(std::make_unique<BoundaryReflectionStep>(m_config.domain_size));
    m_per_step_phases.push_back(std::make_unique<InfectionStep>(m_config.infection_radius, m_config.infection_rate * m_config.dt));
    m_per_step_phases.push_back(std::make_unique<RecoveryStep>(m_config.recovery_rate * m_config.dt));
}

void SimulationEngine::load_initial_configuration(InitialConfiguration initial)
{
    validate_initial_configuration(m_config, initial);

    m_state.positions = std::move(initial.positions);
    m_state.velocities = std::move(initial.velocities);
    m_state.states = std::move(initial.states);
    m_state.infection_times.assign(m_state.states.size(), 0.0);
    m_state.counts = count_states(m_state.states);
    m_state.current_time = 0.0;

    m_history.clear();
    record_history();
    build_step_pipeline();
}

void SimulationEngine::advance()
{
    m_state.infected_at_step_start.clear();
    for (size_t i = 0; i < m_state.states.size(); ++i)
    {
        if (m_state.states[i] == HealthState::Infected)
        {
            m_state.infected_at_step_start.push_back(i);
        }
    }

    for (const auto &phase : m_per_step_phases)
    {
        phase->execute(m_state, m_rng);
    }

    // Derived from the step count so long runs do not accumulate rounding drift.
    ++m_steps_taken;
    m_state.current_time = static_cast<double>(m_steps_taken) * m_config.dt;

    record_history();
    check_invariants();
}

void SimulationEngine::run_steps(int num_steps)
{
    for (int i = 0; i < num_steps; ++i)
    {
        advance();
    }
}

void SimulationEngine::record_history()
{
    m_history.push_back({m_state.current_time,
                         m_state.counts.susceptible,
                         m_state.counts.infected,
                         m_state.counts.recovered});
}

void SimulationEngine::check_invariants() const
{
    const StateCounts recount = count_states(m_state.states);
    if (recount.total() != m_config.population ||
        recount.susceptible != m_state.counts.susceptible ||
        recount.infected != m_state.counts.infected ||
        recount.recovered != m_state.counts.recovered)
    {
        throw SimulationException(SimErrc::InvariantViolation,
                                  "State counts diverged from the population after step " + std::to_string(m_steps_taken) + ".");
    }

    for (size_t i = 0; i < m_state.positions.size(); ++i)
    {
        const Vec2 &p = m_state.positions[i];
        if (!(p.x >= 0.0 && p.x <= m_config.domain_size && p.y >= 0.0 && p.y <= m_config.domain_size))
        {
            throw SimulationException(SimErrc::InvariantViolation, "Position left the domain after boundary correction.", static_cast<long>(i));
        }
    }
}

const RunConfig &SimulationEngine::get_config() const
{
    return m_config;
}

const std::vector<Vec2> &SimulationEngine::get_positions() const
{
    return m_state.positions;
}

const std::vector<Vec2> &SimulationEngine::get_velocities() const
{
    return m_state.velocities;
}

const std::vector<HealthState> &SimulationEngine::get_states() const
{
    return m_state.states;
}

const std::vector<double> &SimulationEngine::get_infection_times() const
{
    return m_state.infection_times;
}

const StateCounts &SimulationEngine::get_counts() const
{
    return m_state.counts;
}

const TimeSeries &SimulationEngine::get_history() const
{
    return m_history;
}

double SimulationEngine::get_current_time() const
{
    return m_state.current_time;
}

long SimulationEngine::get_steps_taken() const
{
    return m_steps_taken;
}
