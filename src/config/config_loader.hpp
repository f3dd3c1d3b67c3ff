#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace coderun::config {

// Defaults, then the JSON file, then environment variables.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

std::filesystem::path GetConfigPath();

}  // namespace coderun::config
