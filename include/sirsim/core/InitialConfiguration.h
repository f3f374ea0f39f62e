#pragma once

#include "include/sirsim/core/DataStructures.h"
#include <vector>

void validate_run_config(const RunConfig &config);

// Draws positions, then direction angles, then speeds, then the I0 initially
// infected agents (without replacement) from rng, in that order.
InitialConfiguration generate_initial_configuration(const RunConfig &config, RandomEngine &rng);

void validate_initial_configuration(const RunConfig &config, const InitialConfiguration &initial);

StateCounts count_states(const std::vector<HealthState> &states);
