#include "reminorcpp/engine_config.hpp"

#include "../core/json_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace reminorcpp {
namespace {

[[noreturn]] void ThrowWrongType(const std::string& key, const char* expected) {
  throw std::runtime_error("config key '" + key + "' must be " + expected);
}

void ReadBool(const Json::Value& object, const char* key, bool& out) {
  if (!object.isMember(key)) {
    return;
  }
  if (!object[key].isBool()) {
    ThrowWrongType(key, "a boolean");
  }
  out = object[key].asBool();
}

void ReadInt(const Json::Value& object, const char* key, int& out) {
  if (!object.isMember(key)) {
    return;
  }
  if (!object[key].isInt()) {
    ThrowWrongType(key, "an integer");
  }
  out = object[key].asInt();
}

void ReadFloat(const Json::Value& object, const char* key, float& out) {
  if (!object.isMember(key)) {
    return;
  }
  if (!object[key].isNumeric()) {
    ThrowWrongType(key, "a number");
  }
  out = object[key].asFloat();
}

void ReadString(const Json::Value& object, const char* key, std::string& out) {
  if (!object.isMember(key)) {
    return;
  }
  if (!object[key].isString()) {
    ThrowWrongType(key, "a string");
  }
  out = object[key].asString();
}

void ReadStringList(const Json::Value& object, const char* key, std::vector<std::string>& out) {
  if (!object.isMember(key)) {
    return;
  }
  const auto& list = object[key];
  if (!list.isArray()) {
    ThrowWrongType(key, "an array of strings");
  }
  std::vector<std::string> values{};
  for (const auto& item : list) {
    if (!item.isString()) {
      ThrowWrongType(key, "an array of strings");
    }
    values.push_back(item.asString());
  }
  out = std::move(values);
}

const Json::Value* Section(const Json::Value& root, const char* key) {
  if (!root.isMember(key)) {
    return nullptr;
  }
  if (!root[key].isObject()) {
    ThrowWrongType(key, "an object");
  }
  return &root[key];
}

bool IsKnownLevel(const std::string& level) {
  return level == "trace" || level == "debug" || level == "info" || level == "warn" || level == "warning" ||
         level == "error" || level == "critical" || level == "off";
}

}  // namespace

EngineConfig EngineConfigFromJson(const Json::Value& root) {
  if (!root.isObject()) {
    throw std::runtime_error("engine config must be a JSON object");
  }
  EngineConfig config{};
  ReadBool(root, "enable_lexical_search", config.enable_lexical_search);
  ReadBool(root, "enable_vector_search", config.enable_vector_search);
  ReadInt(root, "import_min_chars", config.import_min_chars);
  ReadString(root, "log_level", config.log_level);

  if (const auto* retrieval = Section(root, "retrieval"); retrieval != nullptr) {
    auto& r = config.retrieval;
    ReadFloat(*retrieval, "semantic_score_scale", r.semantic_score_scale);
    ReadFloat(*retrieval, "semantic_similarity_floor", r.semantic_similarity_floor);
    ReadFloat(*retrieval, "month_match_bonus", r.month_match_bonus);
    ReadFloat(*retrieval, "keyword_base_weight", r.keyword_base_weight);
    ReadInt(*retrieval, "snippet_chars_before", r.snippet_chars_before);
    ReadInt(*retrieval, "snippet_chars_after", r.snippet_chars_after);
    ReadInt(*retrieval, "min_keyword_length", r.min_keyword_length);
    ReadInt(*retrieval, "strategy_depth_multiplier", r.strategy_depth_multiplier);
    ReadInt(*retrieval, "semantic_preview_chars", r.semantic_preview_chars);
    ReadStringList(*retrieval, "entity_vocabulary", r.entity_vocabulary);
  }
  if (const auto* context = Section(root, "context"); context != nullptr) {
    ReadInt(*context, "max_snippets", config.context.max_snippets);
    ReadInt(*context, "recent_preview_chars", config.context.recent_preview_chars);
    ReadString(*context, "related_label", config.context.related_label);
  }
  if (const auto* analysis = Section(root, "analysis"); analysis != nullptr) {
    ReadString(*analysis, "schema_version", config.analysis.schema_version);
    ReadInt(*analysis, "min_text_chars", config.analysis.min_text_chars);
    ReadInt(*analysis, "max_text_chars", config.analysis.max_text_chars);
  }
  return config;
}

Json::Value EngineConfigToJson(const EngineConfig& config) {
  Json::Value root{Json::objectValue};
  root["enable_lexical_search"] = config.enable_lexical_search;
  root["enable_vector_search"] = config.enable_vector_search;
  root["import_min_chars"] = config.import_min_chars;
  root["log_level"] = config.log_level;

  auto& retrieval = root["retrieval"];
  retrieval["semantic_score_scale"] = config.retrieval.semantic_score_scale;
  retrieval["semantic_similarity_floor"] = config.retrieval.semantic_similarity_floor;
  retrieval["month_match_bonus"] = config.retrieval.month_match_bonus;
  retrieval["keyword_base_weight"] = config.retrieval.keyword_base_weight;
  retrieval["snippet_chars_before"] = config.retrieval.snippet_chars_before;
  retrieval["snippet_chars_after"] = config.retrieval.snippet_chars_after;
  retrieval["min_keyword_length"] = config.retrieval.min_keyword_length;
  retrieval["strategy_depth_multiplier"] = config.retrieval.strategy_depth_multiplier;
  retrieval["semantic_preview_chars"] = config.retrieval.semantic_preview_chars;
  Json::Value vocabulary{Json::arrayValue};
  for (const auto& word : config.retrieval.entity_vocabulary) {
    vocabulary.append(word);
  }
  retrieval["entity_vocabulary"] = vocabulary;

  auto& context = root["context"];
  context["max_snippets"] = config.context.max_snippets;
  context["recent_preview_chars"] = config.context.recent_preview_chars;
  context["related_label"] = config.context.related_label;

  auto& analysis = root["analysis"];
  analysis["schema_version"] = config.analysis.schema_version;
  analysis["min_text_chars"] = config.analysis.min_text_chars;
  analysis["max_text_chars"] = config.analysis.max_text_chars;
  return root;
}

EngineConfig LoadEngineConfig(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open engine config: " + path.string());
  }
  std::ostringstream buffer{};
  buffer << in.rdbuf();
  return EngineConfigFromJson(core::RequireJson(buffer.str(), path.string()));
}

void SaveEngineConfig(const std::filesystem::path& path, const EngineConfig& config) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write engine config: " + path.string());
  }
  out << core::WritePrettyJson(EngineConfigToJson(config)) << "\n";
  if (!out) {
    throw std::runtime_error("failed writing engine config: " + path.string());
  }
}

void ValidateEngineConfig(const EngineConfig& config) {
  const auto& r = config.retrieval;
  if (r.semantic_score_scale <= 0.0f) {
    throw std::invalid_argument("retrieval.semantic_score_scale must be positive");
  }
  if (r.semantic_similarity_floor < -1.0f || r.semantic_similarity_floor >= 1.0f) {
    throw std::invalid_argument("retrieval.semantic_similarity_floor must be in [-1, 1)");
  }
  if (r.keyword_base_weight < 0.0f || r.month_match_bonus < 0.0f) {
    throw std::invalid_argument("retrieval keyword weights must be non-negative");
  }
  if (r.snippet_chars_before < 0 || r.snippet_chars_after <= 0) {
    throw std::invalid_argument("retrieval snippet window must be positive");
  }
  if (r.min_keyword_length <= 0 || r.strategy_depth_multiplier <= 0 || r.semantic_preview_chars <= 0) {
    throw std::invalid_argument("retrieval lengths and depth multiplier must be positive");
  }
  if (config.context.max_snippets < 0 || config.context.recent_preview_chars <= 0) {
    throw std::invalid_argument("context limits must be positive");
  }
  if (config.analysis.schema_version.empty()) {
    throw std::invalid_argument("analysis.schema_version must not be empty");
  }
  if (config.analysis.min_text_chars < 0 || config.analysis.max_text_chars <= 0) {
    throw std::invalid_argument("analysis text bounds must be positive");
  }
  if (config.import_min_chars < 0) {
    throw std::invalid_argument("import_min_chars must be non-negative");
  }
  if (!IsKnownLevel(config.log_level)) {
    throw std::invalid_argument("unknown log level: " + config.log_level);
  }
}

void ConfigureLogging(const std::string& level) {
  if (!IsKnownLevel(level)) {
    throw std::invalid_argument("unknown log level: " + level);
  }
  std::string effective = level;
  if (const char* env = std::getenv("REMINORCPP_LOG_LEVEL"); env != nullptr && *env != '\0') {
    if (IsKnownLevel(env)) {
      effective = env;
    } else {
      spdlog::warn("ignoring unknown REMINORCPP_LOG_LEVEL '{}'", env);
    }
  }
  spdlog::set_level(spdlog::level::from_str(effective));
}

}  // namespace reminorcpp
