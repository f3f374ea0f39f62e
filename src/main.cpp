#include "include/sirsim/ensemble/EnsembleRunner.h"
#include "include/sirsim/ensemble/statistics.h"
#include "include/sirsim/io/io.h"
#include "include/sirsim/core/SimulationException.h"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

void print_statistics(const EnsembleResult &result);

static double round4(double value)
{
    return std::round(value * 10000.0) / 10000.0;
}

void run_preview_mode(const std::string &recipe_path)
{
    EnsembleRunner runner(recipe_path, true);
    EnsembleResult result = runner.run();

    if (result.mean.empty())
    {
        nlohmann::json error_json;
        error_json["status"] = "error";
        error_json["message"] = "No results were generated.";
        std::cout << error_json.dump() << std::endl;
        return;
    }

    const TrajectorySummary summary = summarize_trajectory(result.mean);

    nlohmann::json output_json;
    output_json["status"] = "success";
    output_json["type"] = "ensemble_summary";
    output_json["trials"] = result.runs.size();
    output_json["steps"] = runner.get_num_steps();
    output_json["population"] = result.config.run.population;
    output_json["final"] = {{"s", round4(summary.final_susceptible)},
                            {"i", round4(summary.final_infected)},
                            {"r", round4(summary.final_recovered)}};
    output_json["peak_infected"] = round4(summary.peak_infected);
    output_json["peak_time"] = round4(summary.peak_time);

    std::cout << output_json.dump() << std::endl;
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " [--preview] <path_to_recipe.json>" << std::endl;
        return 1;
    }

    std::string recipe_path;
    bool preview_mode = false;

    if (argc == 3 && std::string(argv[1]) == "--preview")
    {
        preview_mode = true;
        recipe_path = argv[2];
    }
    else if (argc == 2)
    {
        recipe_path = argv[1];
    }
    else
    {
        std::cerr << "Usage: " << argv[0] << " [--preview] <path_to_recipe.json>" << std::endl;
        return 1;
    }

    try
    {
        if (preview_mode)
        {
            run_preview_mode(recipe_path);
        }
        else
        {
            EnsembleRunner runner(recipe_path);
            EnsembleResult result = runner.run();
            print_statistics(result);

            const OutputConfig &output = result.config.output;
            if (!output.report_file.empty())
            {
                write_ensemble_report_json(output.report_file, result);
            }
            if (!output.time_series_file.empty())
            {
                write_time_series_to_csv(output.time_series_file, result.mean, result.stddev);
            }
            std::cout << "\nExecution finished." << std::endl;
        }
    }
    catch (const SimulationException &e)
    {
        if (preview_mode)
        {
            nlohmann::json error_json;
            error_json["status"] = "error";
            error_json["message"] = e.what();
            std::cout << error_json.dump() << std::endl;
        }
        else
        {
            std::cerr << "An error occurred: " << e.what() << std::endl;
        }
        return 1;
    }
    catch (const std::exception &e)
    {
        if (preview_mode)
        {
            nlohmann::json error_json;
            error_json["status"] = "error";
            error_json["message"] = e.what();
            std::cout << error_json.dump() << std::endl;
        }
        else
        {
            std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        }
        return 1;
    }

    return 0;
}

static void print_summary_line(const std::string &label, double value, int population)
{
    std::cout << "  " << std::left << std::setw(13) << label << std::right << std::setw(10) << value
              << " (" << std::fixed << std::setprecision(1) << 100.0 * value / population << "%)"
              << std::defaultfloat << std::setprecision(6) << std::endl;
}

void print_statistics(const EnsembleResult &result)
{
    if (result.runs.empty())
    {
        std::cout << "No simulation data to analyze." << std::endl;
        return;
    }

    const int population = result.config.run.population;
    const TrajectorySummary mean_summary = summarize_trajectory(result.mean);

    std::cout << "\n--- Ensemble Statistics ---" << std::endl;
    std::cout << "Trials: " << result.runs.size() << ", Time points per trial: " << result.mean.size() << std::endl;
    std::cout << "Mean peak infected: " << mean_summary.peak_infected << " at t = " << mean_summary.peak_time << std::endl;
    std::cout << "Final mean distribution:" << std::endl;
    print_summary_line("Susceptible", mean_summary.final_susceptible, population);
    print_summary_line("Infected", mean_summary.final_infected, population);
    print_summary_line("Recovered", mean_summary.final_recovered, population);

    std::cout << "\n--- Per-Run Summary ---" << std::endl;
    for (size_t k = 0; k < result.runs.size(); ++k)
    {
        const TrajectorySummary run_summary = summarize_trajectory(to_aggregate_series(result.runs[k]));
        std::cout << "  Run " << k << ": peak I = " << run_summary.peak_infected
                  << " at t = " << run_summary.peak_time
                  << ", final S/I/R = " << run_summary.final_susceptible << "/"
                  << run_summary.final_infected << "/" << run_summary.final_recovered << std::endl;
    }

    if (!result.stddev.empty())
    {
        const AggregatePoint &last_sd = result.stddev.back();
        std::cout << "\nFinal Std. Dev (S/I/R): " << last_sd.susceptible << " / "
                  << last_sd.infected << " / " << last_sd.recovered << std::endl;
    }
}
