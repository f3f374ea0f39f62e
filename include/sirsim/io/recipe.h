#pragma once

#include "include/sirsim/core/DataStructures.h"
#include <string>

EnsembleConfig load_ensemble_config(const std::string &json_recipe_path);

EnsembleConfig parse_ensemble_config(const json &recipe_json);
