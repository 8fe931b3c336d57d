#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace toolguard::config {

// ~/.toolguard/config.json, or TOOLGUARD_CONFIG when set.
std::filesystem::path GetConfigPath();

// Unknown keys and values of the wrong type are ignored.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Environment overrides take precedence over the file.
void ApplyEnvOverrides(Config& config);

// A missing file yields the defaults; a malformed one is reported on stderr
// and also yields the defaults.
Config LoadConfigFrom(const std::filesystem::path& path);

Config LoadConfig();

}  // namespace toolguard::config
