#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace rlm::config {

std::filesystem::path GetConfigPath();

// Defaults, then the JSON file (when present), then environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

// Throws utils::ConfigurationError when a run cannot start with this config.
void ValidateConfig(const Config& config);

}  // namespace rlm::config
