#pragma once

#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/types.hpp"

#include <json/json.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reminorcpp {

// One way of turning a persisted field back into JSON. Returns nullopt when it does not apply.
using JsonDecodeStrategy = std::function<std::optional<Json::Value>(std::string_view)>;

// Strict parse, then unwrap a JSON string holding JSON, then strip stray quotes and escaped
// quotes and parse again. Each strategy only accepts a non-string result.
[[nodiscard]] std::vector<JsonDecodeStrategy> DefaultJsonDecodeStrategies();

// First successful strategy wins.
[[nodiscard]] std::optional<Json::Value> DecodeLayeredJson(std::string_view raw,
                                                           const std::vector<JsonDecodeStrategy>& strategies);
[[nodiscard]] std::optional<Json::Value> DecodeLayeredJson(std::string_view raw);

// Per-date emotion scores and derived insights. Writes for different dates are independent.
class AnnotationStore {
 public:
  explicit AnnotationStore(JournalDatabase& db);

  // Empty `emotions` stores nothing and returns false. Scores are clamped to [0, 1]; the record
  // version starts at 1 and grows on every overwrite.
  bool Save(const CalendarDate& date,
            const EmotionScores& emotions,
            const std::optional<Json::Value>& insights = std::nullopt,
            const std::optional<Json::Value>& profile_updates = std::nullopt);

  // Absent when no record exists or its emotions cannot be decoded.
  [[nodiscard]] std::optional<AnnotationRecord> Load(const CalendarDate& date) const;

  // Every requested date maps to its emotions, or to an empty map.
  [[nodiscard]] std::map<CalendarDate, EmotionScores> LoadEmotionsForDates(
      const std::vector<CalendarDate>& dates) const;

  [[nodiscard]] std::vector<CalendarDate> Dates() const;

 private:
  JournalDatabase& db_;
  std::vector<JsonDecodeStrategy> strategies_;
};

}  // namespace reminorcpp
