// include/fgt/core/util/config_loader.hpp
#pragma once

#include <string>

#include "fgt/core/config.hpp"
#include "fgt/core/status.hpp"

namespace fgt {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Defaults only, validated. Used when no config file is given.
Result<Config> default_config();

}  // namespace fgt
