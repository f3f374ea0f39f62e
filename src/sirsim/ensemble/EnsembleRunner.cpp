#include "include/sirsim/ensemble/EnsembleRunner.h"
#include "include/sirsim/ensemble/statistics.h"
#include "include/sirsim/core/InitialConfiguration.h"
#include "include/sirsim/core/SimulationException.h"
#include "include/sirsim/io/io.h"
#include "include/sirsim/io/recipe.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

EnsembleRunner::EnsembleRunner(const EnsembleConfig &config, bool is_preview)
    : m_config(config), m_is_preview(is_preview), m_num_steps(0)
{
    validate_config();
    prepare_initial_configuration();
}

EnsembleRunner::EnsembleRunner(const std::string &json_recipe_path, bool is_preview)
    : EnsembleRunner(load_ensemble_config(json_recipe_path), is_preview)
{
}

void EnsembleRunner::validate_config() const
{
    validate_run_config(m_config.run);
    if (m_config.num_trials <= 0)
    {
        throw SimulationException(SimErrc::InvalidTrialCount, "Ensemble requires at least one trial, got " + std::to_string(m_config.num_trials) + ".");
    }
    if (!std::isfinite(m_config.t_max) || m_config.t_max < 0.0)
    {
        throw SimulationException(SimErrc::InvalidDuration, "Simulated duration 't_max' must be a non-negative number.");
    }
}

void EnsembleRunner::prepare_initial_configuration()
{
    // Tolerance keeps floor(100 / 0.1) at 1000 despite 0.1 not being representable.
    m_num_steps = static_cast<int>(std::floor(m_config.t_max / m_config.run.dt + 1e-9));

    if (!m_is_preview)
    {
        std::cout << "\n--- Generating Shared Initial Configuration ---" << std::endl;
    }

    if (!m_config.initial_configuration_file.empty())
    {
        m_initial = read_initial_configuration_csv(m_config.initial_configuration_file);
        validate_initial_configuration(m_config.run, m_initial);
        if (!m_is_preview)
        {
            std::cout << "Loaded " << m_initial.positions.size() << " agents from " << m_config.initial_configuration_file << std::endl;
        }
    }
    else
    {
        RandomEngine init_rng(m_config.seed);
        m_initial = generate_initial_configuration(m_config.run, init_rng);
        if (!m_is_preview)
        {
            std::cout << "Generated " << m_initial.positions.size() << " agents with seed " << m_config.seed << std::endl;
        }
    }
}

SimulationEngine EnsembleRunner::make_trial_engine(int trial_index) const
{
    std::seed_seq seq{m_config.trial_seed, static_cast<std::uint32_t>(trial_index)};
    RandomEngine rng(seq);
    // Passed by value: every engine mutates its own copy of the shared arrays.
    return SimulationEngine(m_config.run, m_initial, std::move(rng));
}

void EnsembleRunner::run_batch(int first_trial, int num_trials, std::vector<TimeSeries> &results, std::exception_ptr &out_exception) const
{
    try
    {
        for (int k = first_trial; k < first_trial + num_trials; ++k)
        {
            SimulationEngine engine = make_trial_engine(k);
            engine.run_steps(m_num_steps);
            results[static_cast<size_t>(k)] = engine.get_history();
        }
    }
    catch (...)
    {
        out_exception = std::current_exception();
    }
}

EnsembleResult EnsembleRunner::run()
{
    const unsigned int requested = m_config.num_threads > 0 ? m_config.num_threads : std::thread::hardware_concurrency();
    const unsigned int num_threads = std::min(std::max(1u, requested), static_cast<unsigned int>(m_config.num_trials));
    const int trials_per_thread = m_config.num_trials / static_cast<int>(num_threads);
    const int remainder_trials = m_config.num_trials % static_cast<int>(num_threads);

    if (!m_is_preview)
    {
        std::cout << "\n--- Running " << m_config.num_trials << " Trials (" << m_num_steps << " steps each, "
                  << num_threads << " threads) ---" << std::endl;
    }

    std::vector<TimeSeries> runs(static_cast<size_t>(m_config.num_trials));
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> thread_exceptions(num_threads, nullptr);

    int next_trial = 0;
    for (unsigned int i = 0; i < num_threads; ++i)
    {
        int trials_for_this_thread = trials_per_thread + (i == 0 ? remainder_trials : 0);
        if (trials_for_this_thread > 0)
        {
            threads.emplace_back(&EnsembleRunner::run_batch, this, next_trial, trials_for_this_thread, std::ref(runs), std::ref(thread_exceptions[i]));
            next_trial += trials_for_this_thread;
        }
    }
    for (auto &t : threads)
    {
        t.join();
    }
    for (const auto &ex_ptr : thread_exceptions)
    {
        if (ex_ptr)
        {
            std::rethrow_exception(ex_ptr);
        }
    }

    EnsembleResult result;
    result.config = m_config;
    result.initial = m_initial;
    result.runs = std::move(runs);
    result.mean = compute_mean_trajectory(result.runs);
    result.stddev = compute_stddev_trajectory(result.runs, result.mean);

    if (!m_is_preview)
    {
        std::cout << "All trials complete." << std::endl;
    }
    return result;
}

const EnsembleConfig &EnsembleRunner::get_config() const
{
    return m_config;
}

const InitialConfiguration &EnsembleRunner::get_initial_configuration() const
{
    return m_initial;
}

int EnsembleRunner::get_num_steps() const
{
    return m_num_steps;
}
