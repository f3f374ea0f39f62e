#pragma once

#include "include/sirsim/core/DataStructures.h"
#include <string>

// Report record: {"meta": {...}, "runs": [...], "mean": {...}, "stddev": {...}}.
json build_ensemble_report(const EnsembleResult &result);
void write_ensemble_report_json(const std::string &path, const EnsembleResult &result);

void write_time_series_to_csv(const std::string &path, const AggregateSeries &mean, const AggregateSeries &stddev);

// Expects columns x, y, vx, vy and state (S/I/R or 0/1/2), one row per agent.
InitialConfiguration read_initial_configuration_csv(const std::string &path);
