#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using RandomEngine = std::mt19937;

enum class HealthState
{
    Susceptible,
    Infected,
    Recovered
};

struct Vec2
{
    double x = 0.0;
    double y = 0.0;
};

// Immutable parameters of a single run.
struct RunConfig
{
    double domain_size = 10.0;     // L, agents live in [0, L] x [0, L]
    int population = 200;          // N
    int initial_infected = 5;      // I0
    double max_speed = 0.5;        // vmax, speeds are drawn from [0.5 * vmax, vmax]
    double infection_radius = 0.3; // r
    double infection_rate = 0.5;   // beta
    double recovery_rate = 0.1;    // gamma
    double dt = 0.1;
};

// Starting point of a run. All three arrays hold one entry per agent.
struct InitialConfiguration
{
    std::vector<Vec2> positions;
    std::vector<Vec2> velocities;
    std::vector<HealthState> states;
};

struct StateCounts
{
    int susceptible = 0;
    int infected = 0;
    int recovered = 0;

    int total() const { return susceptible + infected + recovered; }
};

struct TimeSeriesPoint
{
    double time = 0.0;
    int susceptible = 0;
    int infected = 0;
    int recovered = 0;
};
using TimeSeries = std::vector<TimeSeriesPoint>;

// Aggregated (mean or standard deviation) counts at one time index.
struct AggregatePoint
{
    double time = 0.0;
    double susceptible = 0.0;
    double infected = 0.0;
    double recovered = 0.0;
};
using AggregateSeries = std::vector<AggregatePoint>;

struct OutputConfig
{
    std::string report_file;
    std::string time_series_file;
};

struct EnsembleConfig
{
    RunConfig run;
    int num_trials = 10;
    double t_max = 100.0;
    std::uint32_t seed = 12345;
    std::uint32_t trial_seed = 12345;
    unsigned int num_threads = 0; // 0 selects std::thread::hardware_concurrency()
    std::string note;
    std::string initial_configuration_file;
    OutputConfig output;
};

struct EnsembleResult
{
    EnsembleConfig config;
    InitialConfiguration initial;
    std::vector<TimeSeries> runs;
    AggregateSeries mean;
    AggregateSeries stddev;
};

struct TrajectorySummary
{
    double peak_infected = 0.0;
    double peak_time = 0.0;
    double final_susceptible = 0.0;
    double final_infected = 0.0;
    double final_recovered = 0.0;
};
