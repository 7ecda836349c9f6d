#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codejoin::config {

// Defaults, then ~/.codejoin/config.json, then CODEJOIN_* environment overrides.
Config LoadConfig();

// Same layering with an explicit file; a missing file keeps the defaults.
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace codejoin::config
