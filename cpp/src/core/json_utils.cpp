#include "json_utils.hpp"

#include <memory>
#include <stdexcept>

namespace reminorcpp::core {
namespace {

bool ParseInto(std::string_view text, Json::Value& root, std::string& errors) {
  if (text.empty()) {
    errors = "empty document";
    return false;
  }
  Json::CharReaderBuilder builder{};
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["failIfExtra"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}

}  // namespace

std::optional<Json::Value> ParseJson(std::string_view text) {
  Json::Value root{};
  std::string errors{};
  if (!ParseInto(text, root, errors)) {
    return std::nullopt;
  }
  return root;
}

Json::Value RequireJson(std::string_view text, const std::string& context) {
  Json::Value root{};
  std::string errors{};
  if (!ParseInto(text, root, errors)) {
    throw std::runtime_error(context + ": invalid JSON: " + errors);
  }
  return root;
}

std::string WriteJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder{};
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

std::string WritePrettyJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder{};
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

}  // namespace reminorcpp::core
