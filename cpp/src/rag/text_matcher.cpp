#include "reminorcpp/text_matcher.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace reminorcpp {
namespace {

// English month names that double as ordinary words only count when capitalized.
bool IsAmbiguousMonthWord(const std::string& lower) {
  return lower == "may" || lower == "march";
}

}  // namespace

QueryKeywords ExtractQueryKeywords(const std::string& query, int min_keyword_length) {
  QueryKeywords out{};
  std::unordered_set<std::string> seen{};
  for (const auto& word : core::SplitWords(query, false)) {
    const auto lower = core::ToLowerAscii(word.text);
    if (!out.month.has_value()) {
      const auto month = core::MonthFromName(lower);
      const bool capitalized = std::isupper(static_cast<unsigned char>(word.text.front())) != 0;
      if (month.has_value() && (!IsAmbiguousMonthWord(lower) || capitalized)) {
        out.month = month;
      }
    }
    if (core::IsStopword(lower)) {
      continue;
    }
    if (core::Utf8Length(lower) < static_cast<std::size_t>(std::max(min_keyword_length, 0))) {
      continue;
    }
    if (seen.insert(lower).second) {
      out.keywords.push_back(lower);
    }
  }
  return out;
}

DirectTextMatcher::DirectTextMatcher(const EntryStore& entries, RetrievalConfig config)
    : entries_(entries), config_(std::move(config)) {}

std::vector<SearchHit> DirectTextMatcher::Search(const std::string& query, int limit) const {
  if (limit < 0) {
    throw std::invalid_argument("DirectTextMatcher::Search limit must be non-negative");
  }
  if (limit == 0) {
    return {};
  }
  const auto parsed = ExtractQueryKeywords(query, config_.min_keyword_length);
  if (parsed.keywords.empty() && !parsed.month.has_value()) {
    return {};
  }

  std::vector<SearchHit> hits{};
  for (const auto& [date, text] : entries_.All()) {
    const auto lower = core::ToLowerAscii(text);
    float score = 0.0f;
    bool matched = false;
    if (parsed.month.has_value() && date.month == *parsed.month) {
      score += config_.month_match_bonus;
      matched = true;
    }

    float best_keyword_score = 0.0f;
    std::optional<std::size_t> best_offset{};
    for (const auto& keyword : parsed.keywords) {
      const auto count = core::CountOccurrences(lower, keyword);
      if (count == 0) {
        continue;
      }
      const float keyword_score = static_cast<float>(count) *
                                  (config_.keyword_base_weight + static_cast<float>(core::Utf8Length(keyword)));
      score += keyword_score;
      matched = true;
      if (keyword_score > best_keyword_score) {
        best_keyword_score = keyword_score;
        best_offset = lower.find(keyword);
      }
    }
    if (!matched) {
      continue;
    }

    SearchHit hit{};
    hit.date = date;
    hit.score = score;
    hit.source = SearchSource::kDirect;
    hit.snippet = best_offset.has_value()
                      ? core::SnippetAround(text, *best_offset, config_.snippet_chars_before, config_.snippet_chars_after)
                      : core::Preview(text, config_.snippet_chars_after);
    hits.push_back(std::move(hit));
  }

  std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& lhs, const SearchHit& rhs) {
    return lhs.score > rhs.score;
  });
  if (hits.size() > static_cast<std::size_t>(limit)) {
    hits.resize(static_cast<std::size_t>(limit));
  }
  spdlog::debug("direct matcher: {} keywords, {} hits", parsed.keywords.size(), hits.size());
  return hits;
}

}  // namespace reminorcpp
