#include "include/sirsim/core/InitialConfiguration.h"
#include "include/sirsim/core/SimulationException.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <random>
#include <string>

void validate_run_config(const RunConfig &config)
{
    if (config.population <= 0)
        throw SimulationException(SimErrc::InvalidPopulation, "Population must be positive, got " + std::to_string(config.population) + ".");
    if (!std::isfinite(config.domain_size) || config.domain_size <= 0.0)
        throw SimulationException(SimErrc::InvalidDomainSize, "Domain size must be a positive number.");
    if (!std::isfinite(config.dt) || config.dt <= 0.0)
        throw SimulationException(SimErrc::InvalidTimeStep, "Time step 'dt' must be a positive number.");
    if (!std::isfinite(config.max_speed) || config.max_speed < 0.0)
        throw SimulationException(SimErrc::InvalidSpeed, "Maximum speed must be a non-negative number.");
    if (config.initial_infected < 0 || config.initial_infected > config.population)
    {
        throw SimulationException(SimErrc::InitialInfectedOutOfRange,
                                  "Initial infected count " + std::to_string(config.initial_infected) +
                                      " must lie in [0, " + std::to_string(config.population) + "].");
    }
    if (!(config.infection_rate >= 0.0) || !(config.recovery_rate >= 0.0))
        throw SimulationException(SimErrc::InvalidRate, "Infection and recovery rates must be non-negative.");

    // Per-step Bernoulli probabilities must not exceed 1.
    if (config.infection_rate * config.dt > 1.0)
        throw SimulationException(SimErrc::InvalidProbability, "Infection probability per step (infection_rate * dt) exceeds 1.");
    if (config.recovery_rate * config.dt > 1.0)
        throw SimulationException(SimErrc::InvalidProbability, "Recovery probability per step (recovery_rate * dt) exceeds 1.");
}

InitialConfiguration generate_initial_configuration(const RunConfig &config, RandomEngine &rng)
{
    const size_t n = static_cast<size_t>(config.population);
    const double two_pi = 2.0 * std::acos(-1.0);

    InitialConfiguration initial;
    initial.positions.resize(n);
    initial.velocities.resize(n);
    initial.states.assign(n, HealthState::Susceptible);

    std::uniform_real_distribution<double> position_dist(0.0, config.domain_size);
    for (auto &p : initial.positions)
    {
        p.x = position_dist(rng);
        p.y = position_dist(rng);
    }

    std::uniform_real_distribution<double> angle_dist(0.0, two_pi);
    std::vector<double> angles(n);
    for (auto &a : angles)
    {
        a = angle_dist(rng);
    }

    std::uniform_real_distribution<double> speed_dist(0.5 * config.max_speed, config.max_speed);
    for (size_t i = 0; i < n; ++i)
    {
        const double speed = speed_dist(rng);
        initial.velocities[i].x = speed * std::cos(angles[i]);
        initial.velocities[i].y = speed * std::sin(angles[i]);
    }

    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::vector<size_t> infected;
    infected.reserve(static_cast<size_t>(config.initial_infected));
    std::sample(indices.begin(), indices.end(), std::back_inserter(infected),
                static_cast<size_t>(config.initial_infected), rng);
    for (size_t idx : infected)
    {
        initial.states[idx] = HealthState::Infected;
    }

    return initial;
}

void validate_initial_configuration(const RunConfig &config, const InitialConfiguration &initial)
{
    const size_t n = static_cast<size_t>(config.population);
    if (initial.positions.size() != n || initial.velocities.size() != n || initial.states.size() != n)
    {
        throw SimulationException(SimErrc::InvalidInitialConfiguration,
                                  "Initial configuration must hold exactly " + std::to_string(n) +
                                      " positions, velocities and states.");
    }

    for (size_t i = 0; i < n; ++i)
    {
        const Vec2 &p = initial.positions[i];
        if (!(p.x >= 0.0 && p.x <= config.domain_size && p.y >= 0.0 && p.y <= config.domain_size))
        {
            throw SimulationException(SimErrc::InvalidInitialConfiguration, "Initial position lies outside the domain.", static_cast<long>(i));
        }
        const Vec2 &v = initial.velocities[i];
        if (!std::isfinite(v.x) || !std::isfinite(v.y))
        {
            throw SimulationException(SimErrc::InvalidInitialConfiguration, "Initial velocity is not finite.", static_cast<long>(i));
        }
    }
}

StateCounts count_states(const std::vector<HealthState> &states)
{
    StateCounts counts;
    for (HealthState s : states)
    {
        switch (s)
        {
        case HealthState::Susceptible:
            ++counts.susceptible;
            break;
        case HealthState::Infected:
            ++counts.infected;
            break;
        case HealthState::Recovered:
            ++counts.recovered;
            break;
        }
    }
    return counts;
}
