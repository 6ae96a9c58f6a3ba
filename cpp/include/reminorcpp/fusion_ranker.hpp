#pragma once

#include "reminorcpp/entity_index.hpp"
#include "reminorcpp/entry_store.hpp"
#include "reminorcpp/lexical_search.hpp"
#include "reminorcpp/text_matcher.hpp"
#include "reminorcpp/types.hpp"
#include "reminorcpp/vector_index.hpp"

#include <map>
#include <string>
#include <vector>

namespace reminorcpp {

// Candidates asked from each strategy: limit x multiplier, saturated at INT_MAX.
[[nodiscard]] int StrategyDepth(int limit, int multiplier);

// Date-keyed merge of hits from several strategies. A later hit replaces an earlier one for the
// same date only when its score is strictly higher; equal scores keep first-offered order.
class FusedHitSet {
 public:
  // Returns true when the hit was inserted or replaced an existing one.
  bool Offer(SearchHit hit);
  [[nodiscard]] std::vector<SearchHit> Finish(int limit) const;
  [[nodiscard]] std::size_t size() const { return hits_.size(); }

 private:
  std::vector<SearchHit> hits_;
  std::map<CalendarDate, std::size_t> slot_by_date_;
};

// Runs the retrieval strategies in priority order and merges them by date. Any collaborator may
// be null; the direct text matcher is always consulted.
class FusionRanker {
 public:
  FusionRanker(const EntryStore& entries,
               const DirectTextMatcher& matcher,
               const EntityIndex* entities,
               const VectorIndex* vectors,
               const LexicalSearchProvider* lexical,
               RetrievalConfig config);

  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query, int limit) const;

 private:
  [[nodiscard]] std::vector<SearchHit> EntityHits(const std::string& query, int limit) const;
  void OfferSemantic(FusedHitSet& fused, const std::string& query, int depth) const;
  void OfferLexical(FusedHitSet& fused, const std::string& query, int depth) const;

  const EntryStore& entries_;
  const DirectTextMatcher& matcher_;
  const EntityIndex* entities_ = nullptr;
  const VectorIndex* vectors_ = nullptr;
  const LexicalSearchProvider* lexical_ = nullptr;
  RetrievalConfig config_;
};

}  // namespace reminorcpp
