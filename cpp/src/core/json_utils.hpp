#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace reminorcpp::core {

// Parses one complete JSON document; trailing garbage fails the parse.
[[nodiscard]] std::optional<Json::Value> ParseJson(std::string_view text);

// Like ParseJson but throws std::runtime_error with the parser message.
[[nodiscard]] Json::Value RequireJson(std::string_view text, const std::string& context);

// Compact single-line serialization.
[[nodiscard]] std::string WriteJson(const Json::Value& value);
[[nodiscard]] std::string WritePrettyJson(const Json::Value& value);

}  // namespace reminorcpp::core
