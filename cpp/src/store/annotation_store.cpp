#include "reminorcpp/annotation_store.hpp"

#include "../core/json_utils.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace reminorcpp {
namespace {

std::optional<Json::Value> NonString(std::optional<Json::Value> value) {
  if (!value.has_value() || value->isString()) {
    return std::nullopt;
  }
  return value;
}

std::optional<Json::Value> StrictDecode(std::string_view raw) {
  return NonString(core::ParseJson(raw));
}

std::optional<Json::Value> UnwrapDecode(std::string_view raw) {
  const auto outer = core::ParseJson(raw);
  if (!outer.has_value() || !outer->isString()) {
    return std::nullopt;
  }
  return NonString(core::ParseJson(outer->asString()));
}

std::optional<Json::Value> SanitizeDecode(std::string_view raw) {
  while (!raw.empty() && raw.front() == '"') {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && raw.back() == '"') {
    raw.remove_suffix(1);
  }
  std::string cleaned{};
  cleaned.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '"') {
      cleaned.push_back('"');
      ++i;
      continue;
    }
    cleaned.push_back(raw[i]);
  }
  return NonString(core::ParseJson(cleaned));
}

// Free-form fields may legitimately hold a JSON string, as long as it is not encoded JSON.
std::optional<Json::Value> PlainStringDecode(std::string_view raw) {
  auto value = core::ParseJson(raw);
  if (!value.has_value() || !value->isString() || core::ParseJson(value->asString()).has_value()) {
    return std::nullopt;
  }
  return value;
}

float ClampScore(float value) {
  if (std::isnan(value)) {
    return 0.0f;
  }
  return std::clamp(value, 0.0f, 1.0f);
}

Json::Value EmotionsToJson(const EmotionScores& emotions) {
  Json::Value out{Json::objectValue};
  for (const auto& [name, score] : emotions) {
    out[name] = static_cast<double>(ClampScore(score));
  }
  return out;
}

std::optional<EmotionScores> EmotionsFromJson(const Json::Value& value) {
  if (!value.isObject()) {
    return std::nullopt;
  }
  EmotionScores out{};
  for (const auto& name : value.getMemberNames()) {
    const auto& score = value[name];
    if (score.isNumeric()) {
      out[name] = ClampScore(score.asFloat());
    }
  }
  return out;
}

}  // namespace

std::vector<JsonDecodeStrategy> DefaultJsonDecodeStrategies() {
  return {StrictDecode, UnwrapDecode, SanitizeDecode};
}

std::optional<Json::Value> DecodeLayeredJson(std::string_view raw, const std::vector<JsonDecodeStrategy>& strategies) {
  for (const auto& strategy : strategies) {
    if (auto decoded = strategy(raw); decoded.has_value()) {
      return decoded;
    }
  }
  return std::nullopt;
}

std::optional<Json::Value> DecodeLayeredJson(std::string_view raw) {
  return DecodeLayeredJson(raw, DefaultJsonDecodeStrategies());
}

AnnotationStore::AnnotationStore(JournalDatabase& db) : db_(db), strategies_(DefaultJsonDecodeStrategies()) {}

bool AnnotationStore::Save(const CalendarDate& date,
                           const EmotionScores& emotions,
                           const std::optional<Json::Value>& insights,
                           const std::optional<Json::Value>& profile_updates) {
  if (emotions.empty()) {
    return false;
  }
  const auto emotions_text = core::WriteJson(EmotionsToJson(emotions));
  db_.WithSharedWrite([&]() {
    core::Statement upsert(db_.handle(),
                           "INSERT INTO annotations(date, emotions, insights, profile_updates, version, updated_at) "
                           "VALUES(?1, ?2, ?3, ?4, 1, CURRENT_TIMESTAMP) "
                           "ON CONFLICT(date) DO UPDATE SET "
                           "emotions=excluded.emotions, "
                           "insights=excluded.insights, "
                           "profile_updates=excluded.profile_updates, "
                           "version=annotations.version + 1, "
                           "updated_at=CURRENT_TIMESTAMP;");
    upsert.BindText(1, ToIsoString(date)).BindText(2, emotions_text);
    if (insights.has_value()) {
      upsert.BindText(3, core::WriteJson(*insights));
    } else {
      upsert.BindNull(3);
    }
    if (profile_updates.has_value()) {
      upsert.BindText(4, core::WriteJson(*profile_updates));
    } else {
      upsert.BindNull(4);
    }
    upsert.Run();
  });
  return true;
}

std::optional<AnnotationRecord> AnnotationStore::Load(const CalendarDate& date) const {
  const auto key = ToIsoString(date);
  core::Statement select(db_.handle(),
                         "SELECT emotions, insights, profile_updates, version FROM annotations WHERE date = ?1;");
  select.BindText(1, key);
  if (!select.Step()) {
    return std::nullopt;
  }

  const auto raw_emotions = select.ColumnText(0);
  const auto decoded = DecodeLayeredJson(raw_emotions, strategies_);
  const auto emotions = decoded.has_value() ? EmotionsFromJson(*decoded) : std::nullopt;
  if (!emotions.has_value()) {
    spdlog::warn("annotation store: undecodable emotions for {}, treating as absent", key);
    return std::nullopt;
  }

  AnnotationRecord record{};
  record.date = date;
  record.emotions = *emotions;
  record.version = static_cast<std::uint64_t>(select.ColumnInt64(3));

  auto decode_optional = [&](int column, const char* field) -> std::optional<Json::Value> {
    const auto raw = select.ColumnOptionalText(column);
    if (!raw.has_value()) {
      return std::nullopt;
    }
    auto value = DecodeLayeredJson(*raw, strategies_);
    if (!value.has_value()) {
      value = PlainStringDecode(*raw);
    }
    if (!value.has_value()) {
      spdlog::warn("annotation store: undecodable {} for {}, dropping it", field, key);
    }
    return value;
  };
  record.insights = decode_optional(1, "insights");
  record.profile_updates = decode_optional(2, "profile_updates");
  return record;
}

std::map<CalendarDate, EmotionScores> AnnotationStore::LoadEmotionsForDates(
    const std::vector<CalendarDate>& dates) const {
  std::map<CalendarDate, EmotionScores> out{};
  for (const auto& date : dates) {
    const auto record = Load(date);
    out[date] = record.has_value() ? record->emotions : EmotionScores{};
  }
  return out;
}

std::vector<CalendarDate> AnnotationStore::Dates() const {
  std::vector<CalendarDate> out{};
  core::Statement select(db_.handle(), "SELECT date FROM annotations ORDER BY date;");
  while (select.Step()) {
    if (const auto date = ParseIsoDate(select.ColumnText(0)); date.has_value()) {
      out.push_back(*date);
    }
  }
  return out;
}

}  // namespace reminorcpp
