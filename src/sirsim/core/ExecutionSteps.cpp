#include "include/sirsim/core/ExecutionSteps.h"
#include <cmath>
#include <random>

// --- MotionIntegrationStep ---

MotionIntegrationStep::MotionIntegrationStep(double dt)
    : m_dt(dt)
{
}

void MotionIntegrationStep::execute(RunState &state, RandomEngine & /*rng*/) const
{
    for (size_t i = 0; i < state.positions.size(); ++i)
    {
        state.positions[i].x += state.velocities[i].x * m_dt;
        state.positions[i].y += state.velocities[i].y * m_dt;
    }
}

// --- BoundaryReflectionStep ---

BoundaryReflectionStep::BoundaryReflectionStep(double domain_size)
    : m_domain_size(domain_size)
{
}

static void reflect_axis(double &coordinate, double &velocity, double upper)
{
    if (coordinate < 0.0)
    {
        coordinate = 0.0;
        velocity = -velocity;
    }
    else if (coordinate > upper)
    {
        coordinate = upper;
        velocity = -velocity;
    }
}

void BoundaryReflectionStep::execute(RunState &state, RandomEngine & /*rng*/) const
{
    for (size_t i = 0; i < state.positions.size(); ++i)
    {
        reflect_axis(state.positions[i].x, state.velocities[i].x, m_domain_size);
        reflect_axis(state.positions[i].y, state.velocities[i].y, m_domain_size);
    }
}

// --- InfectionStep ---

InfectionStep::InfectionStep(double infection_radius, double probability)
    : m_infection_radius(infection_radius), m_probability(probability)
{
}

void InfectionStep::execute(RunState &state, RandomEngine &rng) const
{
    const auto &sources = state.infected_at_step_start;
    if (sources.empty() || m_infection_radius <= 0.0)
        return;

    std::bernoulli_distribution contagion(m_probability);

    // Agents infected earlier in this loop are not in `sources`, so they never
    // act as a source before the next step.
    for (size_t s_idx = 0; s_idx < state.states.size(); ++s_idx)
    {
        if (state.states[s_idx] != HealthState::Susceptible)
            continue;

        const Vec2 &p = state.positions[s_idx];
        for (size_t i_idx : sources)
        {
            const Vec2 &q = state.positions[i_idx];
            if (std::hypot(p.x - q.x, p.y - q.y) < m_infection_radius)
            {
                if (contagion(rng))
                {
                    state.states[s_idx] = HealthState::Infected;
                    state.infection_times[s_idx] = state.current_time;
                    --state.counts.susceptible;
                    ++state.counts.infected;
                }
                break;
            }
        }
    }
}

// --- RecoveryStep ---

RecoveryStep::RecoveryStep(double probability)
    : m_probability(probability)
{
}

void RecoveryStep::execute(RunState &state, RandomEngine &rng) const
{
    std::bernoulli_distribution recovery(m_probability);
    for (size_t i_idx : state.infected_at_step_start)
    {
        if (recovery(rng))
        {
            state.states[i_idx] = HealthState::Recovered;
            --state.counts.infected;
            ++state.counts.recovered;
        }
    }
}
