#include "reminorcpp/engine_config.hpp"

#include "../../src/core/json_utils.hpp"
#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniquePath(const std::string& suffix) {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("reminorcpp_engine_config_test_" + std::to_string(static_cast<long long>(now)) + suffix);
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void ScenarioDefaults() {
  reminorcpp::tests::Log("scenario: documented defaults");
  const reminorcpp::EngineConfig config{};
  Require(config.retrieval.semantic_score_scale == 20.0F, "semantic scale default");
  Require(config.retrieval.semantic_similarity_floor == 0.2F, "similarity floor default");
  Require(config.retrieval.month_match_bonus == 15.0F, "month bonus default");
  Require(config.retrieval.keyword_base_weight == 5.0F, "keyword weight default");
  Require(config.retrieval.min_keyword_length == 3, "keyword length default");
  Require(config.retrieval.strategy_depth_multiplier == 2, "depth multiplier default");
  Require(config.analysis.schema_version == "2.0", "schema version default");
  Require(config.analysis.min_text_chars == 50 && config.analysis.max_text_chars == 4000, "analysis bounds");
  Require(config.import_min_chars == 10, "import minimum default");
  reminorcpp::ValidateEngineConfig(config);
}

void ScenarioPartialJsonKeepsDefaults() {
  reminorcpp::tests::Log("scenario: missing keys keep defaults");
  const auto json = reminorcpp::core::RequireJson(
      R"({"enable_vector_search": false,
          "retrieval": {"semantic_score_scale": 10, "entity_vocabulary": ["kayak", "Tent"]},
          "analysis": {"schema_version": "3.1"}})",
      "test config");
  const auto config = reminorcpp::EngineConfigFromJson(json);
  Require(!config.enable_vector_search, "vector search should be disabled");
  Require(config.enable_lexical_search, "lexical default kept");
  Require(config.retrieval.semantic_score_scale == 10.0F, "integer accepted for a float field");
  Require(config.retrieval.month_match_bonus == 15.0F, "unspecified field keeps default");
  Require(config.retrieval.entity_vocabulary.size() == 2, "vocabulary replaced");
  Require(config.analysis.schema_version == "3.1", "schema version read");
  Require(config.analysis.max_text_chars == 4000, "unspecified analysis field keeps default");

  const auto round_trip = reminorcpp::EngineConfigFromJson(reminorcpp::EngineConfigToJson(config));
  Require(round_trip.analysis.schema_version == "3.1" && !round_trip.enable_vector_search,
          "serialized config should read back the same");
}

void ScenarioWrongTypesThrow() {
  reminorcpp::tests::Log("scenario: wrongly typed values throw");
  Require(Throws([] {
            (void)reminorcpp::EngineConfigFromJson(
                reminorcpp::core::RequireJson(R"({"enable_lexical_search": "yes"})", "t"));
          }),
          "string for a bool should throw");
  Require(Throws([] {
            (void)reminorcpp::EngineConfigFromJson(
                reminorcpp::core::RequireJson(R"({"retrieval": {"min_keyword_length": 2.5}})", "t"));
          }),
          "fraction for an int should throw");
  Require(Throws([] {
            (void)reminorcpp::EngineConfigFromJson(reminorcpp::core::RequireJson(R"({"context": []})", "t"));
          }),
          "array for a section should throw");
  Require(Throws([] {
            (void)reminorcpp::EngineConfigFromJson(
                reminorcpp::core::RequireJson(R"({"retrieval": {"entity_vocabulary": [1]}})", "t"));
          }),
          "non string vocabulary should throw");
  Require(Throws([] { (void)reminorcpp::EngineConfigFromJson(Json::Value(3)); }), "non object root should throw");
}

void ScenarioValidation() {
  reminorcpp::tests::Log("scenario: validation rejects unusable values");
  auto expect_invalid = [](auto mutate, const std::string& label) {
    reminorcpp::EngineConfig config{};
    mutate(config);
    bool threw = false;
    try {
      reminorcpp::ValidateEngineConfig(config);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    Require(threw, label + " should be rejected");
  };
  expect_invalid([](reminorcpp::EngineConfig& c) { c.retrieval.semantic_score_scale = 0.0F; }, "zero scale");
  expect_invalid([](reminorcpp::EngineConfig& c) { c.retrieval.snippet_chars_after = 0; }, "empty snippet");
  expect_invalid([](reminorcpp::EngineConfig& c) { c.retrieval.strategy_depth_multiplier = 0; }, "zero depth");
  expect_invalid([](reminorcpp::EngineConfig& c) { c.analysis.schema_version.clear(); }, "empty schema version");
  expect_invalid([](reminorcpp::EngineConfig& c) { c.log_level = "loud"; }, "unknown log level");
}

void ScenarioFileLoading() {
  reminorcpp::tests::Log("scenario: loading and saving config files");
  const auto path = UniquePath(".json");
  const auto broken = UniquePath(".broken.json");
  std::error_code ec;
  try {
    reminorcpp::EngineConfig config{};
    config.context.max_snippets = 4;
    config.log_level = "debug";
    reminorcpp::SaveEngineConfig(path, config);
    const auto loaded = reminorcpp::LoadEngineConfig(path);
    Require(loaded.context.max_snippets == 4, "saved field should load");
    Require(loaded.log_level == "debug", "log level should load");

    {
      std::ofstream out(broken);
      out << "{\"retrieval\": {";
    }
    Require(Throws([&] { (void)reminorcpp::LoadEngineConfig(broken); }), "malformed json should throw");
    Require(Throws([] { (void)reminorcpp::LoadEngineConfig("/nonexistent/reminorcpp/config.json"); }),
            "missing file should throw");

    reminorcpp::ConfigureLogging("warn");
    Require(Throws([] { reminorcpp::ConfigureLogging("chatty"); }), "unknown level should throw");
    std::filesystem::remove(path, ec);
    std::filesystem::remove(broken, ec);
  } catch (const std::exception&) {
    std::filesystem::remove(path, ec);
    std::filesystem::remove(broken, ec);
    throw;
  }
}

}  // namespace

int main() {
  try {
    reminorcpp::tests::Log("engine_config_test: start");
    ScenarioDefaults();
    ScenarioPartialJsonKeepsDefaults();
    ScenarioWrongTypesThrow();
    ScenarioValidation();
    ScenarioFileLoading();
    reminorcpp::tests::Log("engine_config_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    reminorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
