#pragma once

#include "include/sirsim/core/DataStructures.h"
#include "include/sirsim/core/SimulationEngine.h"
#include <exception>
#include <string>
#include <vector>

// Runs num_trials engines from one shared initial configuration. Trial k draws
// from its own generator seeded with {trial_seed, k}, so results do not depend
// on how trials are spread over threads.
class EnsembleRunner
{
public:
    explicit EnsembleRunner(const EnsembleConfig &config, bool is_preview = false);
    explicit EnsembleRunner(const std::string &json_recipe_path, bool is_preview = false);

    EnsembleResult run();

    // Fresh engine for trial `trial_index`, holding its own copy of the shared configuration.
    SimulationEngine make_trial_engine(int trial_index) const;

    const EnsembleConfig &get_config() const;
    const InitialConfiguration &get_initial_configuration() const;
    int get_num_steps() const;

private:
    void validate_config() const;
    void prepare_initial_configuration();
    void run_batch(int first_trial, int num_trials, std::vector<TimeSeries> &results, std::exception_ptr &out_exception) const;

    EnsembleConfig m_config;
    bool m_is_preview;
    int m_num_steps;
    InitialConfiguration m_initial;
};
