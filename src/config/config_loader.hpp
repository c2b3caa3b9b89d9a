#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace codetutor::config {

// ~/.codetutor/config.json, or the file named by CODETUTOR_CONFIG.
std::filesystem::path GetConfigPath();

// Defaults, then the config file, then CODETUTOR_* environment variables.
// A missing or malformed file leaves the defaults in place.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

}  // namespace codetutor::config
