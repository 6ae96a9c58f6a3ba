#include "reminorcpp/annotation_store.hpp"
#include "reminorcpp/journal_database.hpp"

#include "../../src/core/json_utils.hpp"
#include "../../src/core/sqlite_statement.hpp"
#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::string RawEmotions(reminorcpp::JournalDatabase& db, const std::string& date) {
  reminorcpp::core::Statement select(db.handle(), "SELECT emotions FROM annotations WHERE date = ?1;");
  select.BindText(1, date);
  Require(select.Step(), "annotation row should exist");
  return select.ColumnText(0);
}

void OverwriteEmotions(reminorcpp::JournalDatabase& db, const std::string& date, const std::string& raw) {
  reminorcpp::core::Statement update(db.handle(), "UPDATE annotations SET emotions = ?1 WHERE date = ?2;");
  update.BindText(1, raw).BindText(2, date);
  update.Run();
}

void ScenarioSaveLoadAndVersioning() {
  reminorcpp::tests::Log("scenario: save, load and version counter");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::AnnotationStore store(db);
  const reminorcpp::CalendarDate date{2024, 6, 15};

  Require(!store.Load(date).has_value(), "missing record should be absent");
  Require(!store.Save(date, {}), "empty emotions should be rejected");
  Require(!store.Load(date).has_value(), "rejected save must store nothing");

  Json::Value insights{Json::objectValue};
  insights["summary"] = "lunch by the lake";
  insights["topics"].append("friends");
  Require(store.Save(date, {{"happy", 0.8F}, {"sad", 1.7F}, {"anxious", -0.5F}}, insights), "first save");

  auto record = store.Load(date);
  Require(record.has_value(), "record should load");
  Require(record->version == 1, "first version is 1");
  Require(record->emotions.at("happy") == 0.8F, "happy score mismatch");
  Require(record->emotions.at("sad") == 1.0F, "scores above 1 are clamped");
  Require(record->emotions.at("anxious") == 0.0F, "scores below 0 are clamped");
  Require(record->insights.has_value() && (*record->insights)["summary"].asString() == "lunch by the lake",
          "insights should round trip");
  Require(!record->profile_updates.has_value(), "profile updates were not saved");

  Json::Value profile{Json::objectValue};
  profile["likes"] = "swimming";
  Require(store.Save(date, {{"serene", 0.6F}}, std::nullopt, profile), "second save");
  record = store.Load(date);
  Require(record.has_value() && record->version == 2, "overwrite should bump the version");
  Require(record->emotions.size() == 1 && record->emotions.count("serene") == 1, "emotions should be replaced");
  Require(!record->insights.has_value(), "insights should be cleared by the overwrite");
  Require(record->profile_updates.has_value() && (*record->profile_updates)["likes"].asString() == "swimming",
          "profile updates should round trip");

  Require(store.Save(date, {{"serene", 0.6F}}, Json::Value("calm day")), "string insights save");
  record = store.Load(date);
  Require(record.has_value() && record->insights.has_value(), "string insights should load");
  Require(record->insights->isString() && record->insights->asString() == "calm day", "string insights round trip");

  Json::Value nested{Json::objectValue};
  nested["summary"] = "double encoded";
  Require(store.Save(date, {{"serene", 0.6F}}, Json::Value(reminorcpp::core::WriteJson(nested))), "encoded save");
  record = store.Load(date);
  Require(record.has_value() && record->insights.has_value() && record->insights->isObject() &&
              (*record->insights)["summary"].asString() == "double encoded",
          "string holding encoded JSON is unwrapped");
}

void ScenarioDoubleEncodedEmotions() {
  reminorcpp::tests::Log("scenario: double encoded emotions still load");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::AnnotationStore store(db);
  const reminorcpp::CalendarDate date{2024, 6, 15};
  const reminorcpp::EmotionScores emotions = {{"happy", 0.8F}, {"grateful", 0.4F}};
  Require(store.Save(date, emotions), "save");

  const auto original = RawEmotions(db, "2024-06-15");
  OverwriteEmotions(db, "2024-06-15", reminorcpp::core::WriteJson(Json::Value(original)));
  Require(RawEmotions(db, "2024-06-15").front() == '"', "field should now be a quoted string");

  const auto record = store.Load(date);
  Require(record.has_value(), "double encoded record should load");
  Require(record->emotions == emotions, "emotions should be identical after decode");
}

void ScenarioStrayQuotesAreSanitized() {
  reminorcpp::tests::Log("scenario: stray quotes and escaped quotes are stripped");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::AnnotationStore store(db);
  const reminorcpp::CalendarDate date{2024, 6, 16};
  Require(store.Save(date, {{"happy", 0.5F}}), "save");

  OverwriteEmotions(db, "2024-06-16", "\"\"{\\\"happy\\\": 0.5}\"\"");
  const auto record = store.Load(date);
  Require(record.has_value(), "sanitized record should load");
  Require(record->emotions.at("happy") == 0.5F, "sanitized score mismatch");

  OverwriteEmotions(db, "2024-06-16", "definitely not json");
  Require(!store.Load(date).has_value(), "undecodable emotions should be treated as absent");
  OverwriteEmotions(db, "2024-06-16", "\"just a string\"");
  Require(!store.Load(date).has_value(), "a plain string is not an emotions record");
}

void ScenarioDecodePipeline() {
  reminorcpp::tests::Log("scenario: decode strategies run in order");
  const auto strict = reminorcpp::DecodeLayeredJson("{\"a\": 1}");
  Require(strict.has_value() && (*strict)["a"].asInt() == 1, "strict decode");
  const auto unwrapped = reminorcpp::DecodeLayeredJson("\"{\\\"a\\\": 2}\"");
  Require(unwrapped.has_value() && (*unwrapped)["a"].asInt() == 2, "unwrap decode");
  Require(!reminorcpp::DecodeLayeredJson("").has_value(), "empty input fails");

  int calls = 0;
  std::vector<reminorcpp::JsonDecodeStrategy> strategies = {
      [&calls](std::string_view) -> std::optional<Json::Value> {
        ++calls;
        return std::nullopt;
      },
      [&calls](std::string_view) -> std::optional<Json::Value> {
        ++calls;
        return Json::Value(Json::objectValue);
      },
      [&calls](std::string_view) -> std::optional<Json::Value> {
        ++calls;
        return std::nullopt;
      },
  };
  Require(reminorcpp::DecodeLayeredJson("whatever", strategies).has_value(), "second strategy should win");
  Require(calls == 2, "strategies after the first success must not run");
}

void ScenarioWeeklyMatrixAndConcurrentDates() {
  reminorcpp::tests::Log("scenario: emotions for a range of dates, written concurrently");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::AnnotationStore store(db);

  std::vector<std::thread> writers{};
  for (unsigned day = 10; day < 14; ++day) {
    writers.emplace_back([&store, day]() {
      for (int round = 0; round < 5; ++round) {
        (void)store.Save({2024, 6, day}, {{"motivated", 0.1F * static_cast<float>(round)}});
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  Require(store.Dates().size() == 4, "one record per date");
  Require(store.Load({2024, 6, 12})->version == 5, "every overwrite should count");

  std::vector<reminorcpp::CalendarDate> week{};
  for (unsigned day = 10; day <= 16; ++day) {
    week.push_back({2024, 6, day});
  }
  const auto matrix = store.LoadEmotionsForDates(week);
  Require(matrix.size() == 7, "every requested date should be present");
  Require(std::fabs(matrix.at({2024, 6, 10}).at("motivated") - 0.4F) < 1e-6F, "last write wins");
  Require(matrix.at({2024, 6, 16}).empty(), "dates without a record map to an empty set");
}

}  // namespace

int main() {
  try {
    reminorcpp::tests::Log("annotation_store_test: start");
    ScenarioSaveLoadAndVersioning();
    ScenarioDoubleEncodedEmotions();
    ScenarioStrayQuotesAreSanitized();
    ScenarioDecodePipeline();
    ScenarioWeeklyMatrixAndConcurrentDates();
    reminorcpp::tests::Log("annotation_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    reminorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
