#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace agentbox::config {

std::filesystem::path DefaultConfigPath();

// Reads ~/.agentbox/config.json, then applies AGENTBOX_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace agentbox::config
