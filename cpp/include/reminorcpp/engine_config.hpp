#pragma once

#include "reminorcpp/types.hpp"

#include <json/json.h>

#include <filesystem>
#include <string>

namespace reminorcpp {

// Missing keys keep their defaults; a key with the wrong type throws std::runtime_error.
[[nodiscard]] EngineConfig EngineConfigFromJson(const Json::Value& root);
[[nodiscard]] Json::Value EngineConfigToJson(const EngineConfig& config);

[[nodiscard]] EngineConfig LoadEngineConfig(const std::filesystem::path& path);
void SaveEngineConfig(const std::filesystem::path& path, const EngineConfig& config);

// Throws std::invalid_argument on non-positive scales or windows and an empty schema version.
void ValidateEngineConfig(const EngineConfig& config);

// Applies `level` ("trace" .. "off") to the default spdlog logger. REMINORCPP_LOG_LEVEL, when set,
// takes precedence.
void ConfigureLogging(const std::string& level);

}  // namespace reminorcpp
