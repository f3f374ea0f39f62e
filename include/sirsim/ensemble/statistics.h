#pragma once

#include "include/sirsim/core/DataStructures.h"
#include <vector>

// Element-wise mean of S/I/R across runs. All runs must have the same length.
AggregateSeries compute_mean_trajectory(const std::vector<TimeSeries> &runs);

// Element-wise population standard deviation around `mean`.
AggregateSeries compute_stddev_trajectory(const std::vector<TimeSeries> &runs, const AggregateSeries &mean);

AggregateSeries to_aggregate_series(const TimeSeries &series);

TrajectorySummary summarize_trajectory(const AggregateSeries &series);
