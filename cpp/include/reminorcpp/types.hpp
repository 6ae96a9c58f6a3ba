#pragma once

#include "reminorcpp/calendar_date.hpp"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reminorcpp {

using EmotionScores = std::map<std::string, float>;
using JournalEntries = std::map<CalendarDate, std::string>;

enum class SearchSource {
  kLexical,
  kSemantic,
  kDirect,
  kEntity,
};

struct SearchHit {
  CalendarDate date{};
  std::string snippet;
  float score = 0.0f;
  SearchSource source = SearchSource::kDirect;
};

struct AnnotationRecord {
  CalendarDate date{};
  EmotionScores emotions;
  std::optional<Json::Value> insights;
  std::optional<Json::Value> profile_updates;
  std::uint64_t version = 0;
};

struct AnalysisResult {
  EmotionScores emotions;
  Json::Value daily_insights{Json::objectValue};
  Json::Value profile_updates{Json::objectValue};
};

struct JournalStats {
  std::size_t total_entries = 0;
  std::size_t total_words = 0;
  std::size_t average_words = 0;
  int current_streak = 0;
  int longest_streak = 0;
  std::optional<CalendarDate> first_entry;
  std::optional<CalendarDate> last_entry;
};

struct RetrievalConfig {
  float semantic_score_scale = 20.0f;
  float semantic_similarity_floor = 0.2f;
  float month_match_bonus = 15.0f;
  float keyword_base_weight = 5.0f;
  int snippet_chars_before = 100;
  int snippet_chars_after = 300;
  int min_keyword_length = 3;
  int strategy_depth_multiplier = 2;
  int semantic_preview_chars = 500;
  std::vector<std::string> entity_vocabulary = {
      "pizza", "mare", "moto", "cena", "pranzo", "lavoro", "sardegna",
      "beach", "dinner", "lunch", "work", "office", "sea",
  };
};

struct ContextConfig {
  int max_snippets = 10;
  int recent_preview_chars = 500;
  std::string related_label = "Related entries";
};

struct AnalysisConfig {
  std::string schema_version = "2.0";
  int min_text_chars = 50;
  int max_text_chars = 4000;
};

struct EngineConfig {
  bool enable_lexical_search = true;
  bool enable_vector_search = true;
  RetrievalConfig retrieval{};
  ContextConfig context{};
  AnalysisConfig analysis{};
  int import_min_chars = 10;
  std::string log_level = "info";
};

[[nodiscard]] const char* SearchSourceName(SearchSource source);

}  // namespace reminorcpp
