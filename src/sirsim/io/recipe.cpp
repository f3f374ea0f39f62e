#include "include/sirsim/io/recipe.h"
#include "include/sirsim/core/SimulationException.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <string>

EnsembleConfig load_ensemble_config(const std::string &json_recipe_path)
{
    std::ifstream file_stream(json_recipe_path);
    if (!file_stream.is_open())
    {
        throw SimulationException(SimErrc::RecipeFileNotFound, "Failed to open recipe file: " + json_recipe_path);
    }
    json recipe_json;
    try
    {
        recipe_json = json::parse(file_stream);
    }
    catch (const json::parse_error &e)
    {
        throw SimulationException(SimErrc::RecipeParseError, "Failed to parse JSON recipe: " + std::string(e.what()));
    }
    return parse_ensemble_config(recipe_json);
}

EnsembleConfig parse_ensemble_config(const json &recipe_json)
{
    EnsembleConfig config;
    try
    {
        const auto &sim = recipe_json.at("simulation_config");
        config.num_trials = sim.at("num_trials").get<int>();
        config.t_max = sim.at("t_max").get<double>();
        config.seed = sim.at("seed").get<std::uint32_t>();
        config.trial_seed = sim.value("trial_seed", config.seed);
        config.num_threads = sim.value("num_threads", 0u);
        config.note = sim.value("note", std::string());

        const auto &params = recipe_json.at("model_params");
        config.run.domain_size = params.at("domain_size").get<double>();
        config.run.population = params.at("population").get<int>();
        config.run.initial_infected = params.at("initial_infected").get<int>();
        config.run.max_speed = params.at("max_speed").get<double>();
        config.run.infection_radius = params.at("infection_radius").get<double>();
        config.run.infection_rate = params.at("infection_rate").get<double>();
        config.run.recovery_rate = params.at("recovery_rate").get<double>();
        config.run.dt = params.at("dt").get<double>();

        if (recipe_json.contains("initial_configuration_file") && recipe_json.at("initial_configuration_file").is_string())
        {
            config.initial_configuration_file = recipe_json.at("initial_configuration_file").get<std::string>();
        }

        if (recipe_json.contains("output"))
        {
            const auto &output = recipe_json.at("output");
            config.output.report_file = output.value("report_file", std::string());
            config.output.time_series_file = output.value("time_series_file", std::string());
        }
    }
    catch (const json::out_of_range &e)
    {
        throw SimulationException(SimErrc::RecipeConfigError, "Missing required key in recipe file: " + std::string(e.what()));
    }
    catch (const json::type_error &e)
    {
        throw SimulationException(SimErrc::RecipeConfigError, "Incorrect type for key in recipe file: " + std::string(e.what()));
    }
    return config;
}
