#pragma once

#include "reminorcpp/entry_store.hpp"
#include "reminorcpp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reminorcpp {

struct QueryKeywords {
  std::vector<std::string> keywords;
  std::optional<unsigned> month;
};

// Lower-cased, stopword-filtered keywords of `query` plus the month it names, if any.
[[nodiscard]] QueryKeywords ExtractQueryKeywords(const std::string& query, int min_keyword_length);

// Brute-force substring scoring over every stored entry. Always available.
class DirectTextMatcher {
 public:
  DirectTextMatcher(const EntryStore& entries, RetrievalConfig config);

  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query, int limit) const;

 private:
  const EntryStore& entries_;
  RetrievalConfig config_;
};

}  // namespace reminorcpp
