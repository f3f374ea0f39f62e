#pragma once

#include "include/sirsim/core/DataStructures.h"
#include "include/sirsim/core/IExecutionStep.h"
#include <memory>
#include <vector>

class SimulationEngine
{
public:
    SimulationEngine(const RunConfig &config, RandomEngine rng);
    SimulationEngine(const RunConfig &config, InitialConfiguration initial, RandomEngine rng);

    void advance();
    void run_steps(int num_steps);

    const RunConfig &get_config() const;
    const std::vector<Vec2> &get_positions() const;
    const std::vector<Vec2> &get_velocities() const;
    const std::vector<HealthState> &get_states() const;
    const std::vector<double> &get_infection_times() const;
    const StateCounts &get_counts() const;
    const TimeSeries &get_history() const;
    double get_current_time() const;
    long get_steps_taken() const;

private:
    void build_step_pipeline();
    void load_initial_configuration(InitialConfiguration initial);
    void record_history();
    void check_invariants() const;

    RunConfig m_config;
    RandomEngine m_rng;
    RunState m_state;
    long m_steps_taken;
    TimeSeries m_history;

    std::vector<std::unique_ptr<IExecutionStep>> m_per_step_phases;
};
