#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codeact::config {

std::filesystem::path GetConfigPath();
std::string ExpandHome(const std::string& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
Config LoadConfigFromJson(const nlohmann::json& data);
Config LoadConfig();

}  // namespace codeact::config
