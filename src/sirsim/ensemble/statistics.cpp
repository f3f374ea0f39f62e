#include "include/sirsim/ensemble/statistics.h"
#include "include/sirsim/core/SimulationException.h"
#include <cmath>
#include <string>

static void check_aligned(const std::vector<TimeSeries> &runs)
{
    if (runs.empty())
    {
        throw SimulationException(SimErrc::EmptyEnsemble, "Cannot aggregate an ensemble without runs.");
    }
    const size_t length = runs.front().size();
    for (size_t k = 1; k < runs.size(); ++k)
    {
        if (runs[k].size() != length)
        {
            throw SimulationException(SimErrc::EnsembleStepMismatch,
                                      "Run " + std::to_string(k) + " has " + std::to_string(runs[k].size()) +
                                          " time points, expected " + std::to_string(length) + ".");
        }
    }
}

AggregateSeries compute_mean_trajectory(const std::vector<TimeSeries> &runs)
{
    check_aligned(runs);

    const size_t length = runs.front().size();
    const double num_runs = static_cast<double>(runs.size());
    AggregateSeries mean(length);

    for (size_t j = 0; j < length; ++j)
    {
        mean[j].time = runs.front()[j].time;
        for (const auto &run : runs)
        {
            mean[j].susceptible += run[j].susceptible;
            mean[j].infected += run[j].infected;
            mean[j].recovered += run[j].recovered;
        }
        mean[j].susceptible /= num_runs;
        mean[j].infected /= num_runs;
        mean[j].recovered /= num_runs;
    }
    return mean;
}

AggregateSeries compute_stddev_trajectory(const std::vector<TimeSeries> &runs, const AggregateSeries &mean)
{
    check_aligned(runs);
    if (mean.size() != runs.front().size())
    {
        throw SimulationException(SimErrc::EnsembleStepMismatch, "Mean trajectory length does not match the runs.");
    }

    const double num_runs = static_cast<double>(runs.size());
    AggregateSeries stddev(mean.size());

    for (size_t j = 0; j < mean.size(); ++j)
    {
        stddev[j].time = mean[j].time;
        for (const auto &run : runs)
        {
            const double ds = run[j].susceptible - mean[j].susceptible;
            const double di = run[j].infected - mean[j].infected;
            const double dr = run[j].recovered - mean[j].recovered;
            stddev[j].susceptible += ds * ds;
            stddev[j].infected += di * di;
            stddev[j].recovered += dr * dr;
        }
        stddev[j].susceptible = std::sqrt(stddev[j].susceptible / num_runs);
        stddev[j].infected = std::sqrt(stddev[j].infected / num_runs);
        stddev[j].recovered = std::sqrt(stddev[j].recovered / num_runs);
    }
    return stddev;
}

AggregateSeries to_aggregate_series(const TimeSeries &series)
{
    AggregateSeries out;
    out.reserve(series.size());
    for (const auto &point : series)
    {
        out.push_back({point.time,
                       static_cast<double>(point.susceptible),
                       static_cast<double>(point.infected),
                       static_cast<double>(point.recovered)});
    }
    return out;
}

TrajectorySummary summarize_trajectory(const AggregateSeries &series)
{
    TrajectorySummary summary;
    if (series.empty())
        return summary;

    // First maximum wins on ties.
    for (const auto &point : series)
    {
        if (point.infected > summary.peak_infected)
        {
            summary.peak_infected = point.infected;
            summary.peak_time = point.time;
        }
    }

    const AggregatePoint &last = series.back();
    summary.final_susceptible = last.susceptible;
    summary.final_infected = last.infected;
    summary.final_recovered = last.recovered;
    return summary;
}
