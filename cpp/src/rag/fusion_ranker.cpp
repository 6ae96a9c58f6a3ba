#include "reminorcpp/fusion_ranker.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace reminorcpp {

const char* SearchSourceName(SearchSource source) {
  switch (source) {
    case SearchSource::kLexical:
      return "lexical";
    case SearchSource::kSemantic:
      return "semantic";
    case SearchSource::kDirect:
      return "direct";
    case SearchSource::kEntity:
      return "entity";
  }
  return "unknown";
}

bool FusedHitSet::Offer(SearchHit hit) {
  const auto it = slot_by_date_.find(hit.date);
  if (it == slot_by_date_.end()) {
    slot_by_date_.emplace(hit.date, hits_.size());
    hits_.push_back(std::move(hit));
    return true;
  }
  auto& existing = hits_[it->second];
  if (hit.score > existing.score) {
    existing = std::move(hit);
    return true;
  }
  return false;
}

int StrategyDepth(int limit, int multiplier) {
  const auto depth = static_cast<std::int64_t>(limit) * std::max(multiplier, 1);
  return static_cast<int>(std::min<std::int64_t>(depth, std::numeric_limits<int>::max()));
}

std::vector<SearchHit> FusedHitSet::Finish(int limit) const {
  std::vector<SearchHit> out = hits_;
  std::stable_sort(out.begin(), out.end(), [](const SearchHit& lhs, const SearchHit& rhs) {
    return lhs.score > rhs.score;
  });
  if (limit >= 0 && out.size() > static_cast<std::size_t>(limit)) {
    out.resize(static_cast<std::size_t>(limit));
  }
  return out;
}

FusionRanker::FusionRanker(const EntryStore& entries,
                           const DirectTextMatcher& matcher,
                           const EntityIndex* entities,
                           const VectorIndex* vectors,
                           const LexicalSearchProvider* lexical,
                           RetrievalConfig config)
    : entries_(entries),
      matcher_(matcher),
      entities_(entities),
      vectors_(vectors),
      lexical_(lexical),
      config_(std::move(config)) {}

std::vector<SearchHit> FusionRanker::EntityHits(const std::string& query, int limit) const {
  if (entities_ == nullptr) {
    return {};
  }
  const auto counts = entities_->LookupQuery(query);
  if (counts.empty()) {
    return {};
  }

  std::vector<std::string> query_words{};
  for (const auto& word : core::SplitWords(core::ToLowerAscii(query), true)) {
    if (!entities_->DatesFor(word.text).empty()) {
      query_words.push_back(word.text);
    }
  }

  std::vector<SearchHit> hits{};
  hits.reserve(counts.size());
  for (const auto& [date, count] : counts) {
    const auto text = entries_.Get(date);
    if (!text.has_value()) {
      continue;
    }
    SearchHit hit{};
    hit.date = date;
    hit.score = static_cast<float>(count);
    hit.source = SearchSource::kEntity;
    hit.snippet = core::Preview(*text, config_.snippet_chars_after);
    for (const auto& word : core::SplitWords(core::ToLowerAscii(*text), true)) {
      if (std::find(query_words.begin(), query_words.end(), word.text) != query_words.end()) {
        hit.snippet = core::SnippetAround(*text, word.offset, config_.snippet_chars_before, config_.snippet_chars_after);
        break;
      }
    }
    hits.push_back(std::move(hit));
  }

  std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& lhs, const SearchHit& rhs) {
    return lhs.score > rhs.score;
  });
  if (hits.size() > static_cast<std::size_t>(limit)) {
    hits.resize(static_cast<std::size_t>(limit));
  }
  return hits;
}

void FusionRanker::OfferSemantic(FusedHitSet& fused, const std::string& query, int depth) const {
  if (vectors_ == nullptr || !vectors_->available()) {
    return;
  }
  std::vector<VectorMatch> matches{};
  try {
    matches = vectors_->Query(query, depth);
  } catch (const std::exception& error) {
    spdlog::warn("fusion: semantic strategy failed: {}", error.what());
    return;
  }
  for (const auto& match : matches) {
    const auto text = entries_.Get(match.date);
    if (!text.has_value()) {
      continue;
    }
    fused.Offer(SearchHit{match.date,
                          core::Preview(*text, config_.semantic_preview_chars),
                          match.similarity * config_.semantic_score_scale,
                          SearchSource::kSemantic});
  }
}

void FusionRanker::OfferLexical(FusedHitSet& fused, const std::string& query, int depth) const {
  if (lexical_ == nullptr) {
    return;
  }
  std::vector<LexicalHit> hits{};
  try {
    hits = lexical_->Find(query, depth);
  } catch (const std::exception& error) {
    spdlog::warn("fusion: lexical strategy failed: {}", error.what());
    return;
  }
  for (auto& hit : hits) {
    const auto date = FindIsoDate(hit.title);
    if (!date.has_value()) {
      spdlog::debug("fusion: lexical hit without a date in title '{}'", hit.title);
      continue;
    }
    fused.Offer(SearchHit{*date, std::move(hit.snippet), hit.score, SearchSource::kLexical});
  }
}

std::vector<SearchHit> FusionRanker::Search(const std::string& query, int limit) const {
  if (limit < 0) {
    throw std::invalid_argument("FusionRanker::Search limit must be non-negative");
  }
  if (limit == 0) {
    return {};
  }

  auto entity_hits = EntityHits(query, limit);
  if (!entity_hits.empty()) {
    spdlog::debug("fusion: {} entity hits, skipping other strategies", entity_hits.size());
    return entity_hits;
  }

  const int depth = StrategyDepth(limit, config_.strategy_depth_multiplier);
  FusedHitSet fused{};
  OfferSemantic(fused, query, depth);
  OfferLexical(fused, query, depth);
  for (auto& hit : matcher_.Search(query, depth)) {
    fused.Offer(std::move(hit));
  }
  spdlog::debug("fusion: {} candidate dates for '{}'", fused.size(), query);
  return fused.Finish(limit);
}

}  // namespace reminorcpp
