#pragma once

#include "reminorcpp/entry_store.hpp"
#include "reminorcpp/fusion_ranker.hpp"
#include "reminorcpp/temporal_resolver.hpp"
#include "reminorcpp/types.hpp"

#include <string>
#include <vector>

namespace reminorcpp {

// Builds the journal context handed to a chat model: entries for explicitly named dates first,
// verbatim, then similarity hits.
class ContextAssembler {
 public:
  ContextAssembler(const EntryStore& entries,
                   const TemporalQueryResolver& resolver,
                   const FusionRanker& ranker,
                   ContextConfig config);

  [[nodiscard]] std::string Assemble(const std::string& query, int max_snippets) const;
  [[nodiscard]] std::string Assemble(const std::string& query) const;

 private:
  [[nodiscard]] std::string RecentContext(int max_entries) const;

  const EntryStore& entries_;
  const TemporalQueryResolver& resolver_;
  const FusionRanker& ranker_;
  ContextConfig config_;
};

[[nodiscard]] std::string FormatSimilarityContext(const std::vector<SearchHit>& hits);

}  // namespace reminorcpp
