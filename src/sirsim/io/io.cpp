#include "include/sirsim/io/io.h"
#include "include/sirsim/core/SimulationException.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// The csv.hpp header from the csv-parser library generates some warnings on MSVC
// with high warning levels. We will temporarily disable the specific warning (C4127)
// just for the inclusion of this header.
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4127) // C4127: conditional expression is constant
#endif

#include "csv.hpp"

#ifdef _MSC_VER
#pragma warning(pop)
#endif

static std::ofstream open_output_file(const std::string &path)
{
    const std::filesystem::path target(path);
    if (target.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            throw SimulationException(SimErrc::OutputFileWriteFailed, "Could not create directory for '" + path + "': " + ec.message());
        }
    }
    std::ofstream output_file(path);
    if (!output_file.is_open())
    {
        throw SimulationException(SimErrc::OutputFileWriteFailed, "Could not open output file '" + path + "' for writing.");
    }
    return output_file;
}

static std::string format_number(double value)
{
    std::ostringstream out;
    out.precision(10);
    out << value;
    return out.str();
}

// --- JSON Report ---

static json series_to_json(const AggregateSeries &series)
{
    std::vector<double> t, s, i, r;
    t.reserve(series.size());
    s.reserve(series.size());
    i.reserve(series.size());
    r.reserve(series.size());
    for (const auto &point : series)
    {
        t.push_back(point.time);
        s.push_back(point.susceptible);
        i.push_back(point.infected);
        r.push_back(point.recovered);
    }
    return json{{"t", t}, {"s", s}, {"i", i}, {"r", r}};
}

json build_ensemble_report(const EnsembleResult &result)
{
    const EnsembleConfig &config = result.config;
    const RunConfig &run = config.run;

    json report;
    report["meta"] = {
        {"model", "particles"},
        {"params", {{"L", run.domain_size}, {"Ntotal", run.population}, {"I0", run.initial_infected}, {"vmax", run.max_speed}, {"r", run.infection_radius}, {"beta", run.infection_rate}, {"gamma", run.recovery_rate}, {"dt", run.dt}}},
        {"Nexp", config.num_trials},
        {"T_max", config.t_max},
        {"dt", run.dt},
        {"seed_init", config.seed},
        {"trial_seed", config.trial_seed},
        {"note", config.note}};

    json runs = json::array();
    for (size_t k = 0; k < result.runs.size(); ++k)
    {
        std::vector<double> t;
        std::vector<int> s, i, r;
        for (const auto &point : result.runs[k])
        {
            t.push_back(point.time);
            s.push_back(point.susceptible);
            i.push_back(point.infected);
            r.push_back(point.recovered);
        }
        runs.push_back({{"run_id", k}, {"t", t}, {"s", s}, {"i", i}, {"r", r}});
    }
    report["runs"] = runs;
    report["mean"] = series_to_json(result.mean);
    report["stddev"] = series_to_json(result.stddev);
    return report;
}

void write_ensemble_report_json(const std::string &path, const EnsembleResult &result)
{
    std::ofstream output_file = open_output_file(path);
    std::cout << "\n--- Writing report to " << path << " ---" << std::endl;
    output_file << build_ensemble_report(result).dump(2) << "\n";
    std::cout << "Successfully wrote " << result.runs.size() << " runs." << std::endl;
}

// --- CSV Time Series ---

void write_time_series_to_csv(const std::string &path, const AggregateSeries &mean, const AggregateSeries &stddev)
{
    if (stddev.size() != mean.size())
    {
        throw SimulationException(SimErrc::EnsembleStepMismatch, "Mean and standard deviation series differ in length.");
    }

    std::ofstream output_file = open_output_file(path);
    std::cout << "\n--- Writing time series to " << path << " ---" << std::endl;

    auto writer = csv::make_csv_writer(output_file);
    writer << std::vector<std::string>{"time", "susceptible", "infected", "recovered", "susceptible_sd", "infected_sd", "recovered_sd"};
    for (size_t j = 0; j < mean.size(); ++j)
    {
        writer << std::vector<std::string>{
            format_number(mean[j].time),
            format_number(mean[j].susceptible),
            format_number(mean[j].infected),
            format_number(mean[j].recovered),
            format_number(stddev[j].susceptible),
            format_number(stddev[j].infected),
            format_number(stddev[j].recovered)};
    }

    std::cout << "Successfully wrote " << mean.size() << " time points." << std::endl;
}

// --- CSV Initial Configuration ---

static HealthState parse_health_state(const std::string &text, long row_index)
{
    if (text == "S" || text == "0")
        return HealthState::Susceptible;
    if (text == "I" || text == "1")
        return HealthState::Infected;
    if (text == "R" || text == "2")
        return HealthState::Recovered;
    throw SimulationException(SimErrc::CsvConversionError, "Unknown health state '" + text + "' in column 'state'.", row_index);
}

InitialConfiguration read_initial_configuration_csv(const std::string &path)
{
    {
        std::ifstream probe(path);
        if (!probe.is_open())
        {
            throw SimulationException(SimErrc::CsvFileNotFound, "Failed to open initial configuration file: " + path);
        }
    }

    csv::CSVReader reader(path);
    const std::vector<std::string> header = reader.get_col_names();
    for (const char *column : {"x", "y", "vx", "vy", "state"})
    {
        if (std::find(header.begin(), header.end(), column) == header.end())
        {
            throw SimulationException(SimErrc::CsvColumnNotFound, "Column '" + std::string(column) + "' not found in file '" + path + "'.");
        }
    }

    InitialConfiguration initial;
    long row_index = 0;
    for (csv::CSVRow &row : reader)
    {
        double values[4];
        const char *numeric_columns[4] = {"x", "y", "vx", "vy"};
        for (int c = 0; c < 4; ++c)
        {
            csv::CSVField field = row[numeric_columns[c]];
            if (!field.is_num())
            {
                throw SimulationException(SimErrc::CsvConversionError,
                                          "Value in column '" + std::string(numeric_columns[c]) + "' is not a number.", row_index);
            }
            values[c] = field.get<double>();
        }
        initial.positions.push_back({values[0], values[1]});
        initial.velocities.push_back({values[2], values[3]});
        initial.states.push_back(parse_health_state(row["state"].get<std::string>(), row_index));
        ++row_index;
    }
    return initial;
}
