#include "reminorcpp/context_assembler.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <set>
#include <stdexcept>
#include <utility>

namespace reminorcpp {
namespace {

constexpr const char* kBlockSeparator = "\n\n---\n\n";

std::string FormatScore(float score) {
  char buffer[32] = {};
  std::snprintf(buffer, sizeof(buffer), "%.1f", static_cast<double>(score));
  return std::string(buffer);
}

}  // namespace

std::string FormatSimilarityContext(const std::vector<SearchHit>& hits) {
  std::string out{};
  for (std::size_t i = 0; i < hits.size(); ++i) {
    if (i > 0) {
      out.append(kBlockSeparator);
    }
    out.append("[" + ToIsoString(hits[i].date) + "] (relevance: " + FormatScore(hits[i].score) + ")\n");
    out.append(hits[i].snippet);
  }
  return out;
}

ContextAssembler::ContextAssembler(const EntryStore& entries,
                                   const TemporalQueryResolver& resolver,
                                   const FusionRanker& ranker,
                                   ContextConfig config)
    : entries_(entries), resolver_(resolver), ranker_(ranker), config_(std::move(config)) {}

std::string ContextAssembler::RecentContext(int max_entries) const {
  const auto all = entries_.All();
  std::string out{};
  int emitted = 0;
  for (auto it = all.rbegin(); it != all.rend() && emitted < max_entries; ++it, ++emitted) {
    if (emitted > 0) {
      out.append(kBlockSeparator);
    }
    out.append("[" + ToIsoString(it->first) + "]\n");
    out.append(core::Preview(it->second, config_.recent_preview_chars));
  }
  return out;
}

std::string ContextAssembler::Assemble(const std::string& query) const {
  return Assemble(query, config_.max_snippets);
}

std::string ContextAssembler::Assemble(const std::string& query, int max_snippets) const {
  if (max_snippets < 0) {
    throw std::invalid_argument("ContextAssembler::Assemble max_snippets must be non-negative");
  }
  if (core::IsBlank(query)) {
    return RecentContext(max_snippets);
  }

  std::vector<std::string> parts{};
  std::set<CalendarDate> explicit_dates{};
  for (const auto& date : resolver_.Resolve(query)) {
    const auto text = entries_.Get(date);
    if (!text.has_value()) {
      continue;
    }
    parts.push_back("=== " + ToIsoString(date) + " ===\n" + *text + "\n");
    explicit_dates.insert(date);
  }

  std::vector<SearchHit> related{};
  for (auto& hit : ranker_.Search(query, max_snippets)) {
    if (explicit_dates.count(hit.date) == 0) {
      related.push_back(std::move(hit));
    }
  }
  const auto similarity = FormatSimilarityContext(related);
  spdlog::debug("context: {} explicit dates, {} related hits", explicit_dates.size(), related.size());

  if (parts.empty()) {
    return similarity;
  }
  if (!similarity.empty()) {
    parts.push_back("=== " + config_.related_label + " ===\n" + similarity);
  }

  std::string out{};
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out.append(parts[i]);
  }
  return out;
}

}  // namespace reminorcpp
