#pragma once

#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/types.hpp"

#include <json/json.h>

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace reminorcpp {

using AnalysisFunction = std::function<AnalysisResult(const std::string&)>;

[[nodiscard]] Json::Value AnalysisResultToJson(const AnalysisResult& result);
// Throws std::runtime_error when `value` is not an analysis object.
[[nodiscard]] AnalysisResult AnalysisResultFromJson(const Json::Value& value);

// Memoizes expensive analyses by SHA-256 of the input text. Rows written under another schema
// version are misses; opening the cache drops them all. A corrupt row clears the whole cache.
class AnalysisCache {
 public:
  AnalysisCache(JournalDatabase& db, std::string schema_version);

  // Returns the cached result or runs `compute` and stores what it returns. Exceptions from
  // `compute` propagate and nothing is stored.
  AnalysisResult GetOrCompute(const std::string& text, const AnalysisFunction& compute);

  [[nodiscard]] std::optional<AnalysisResult> Lookup(const std::string& text);
  void InvalidateAll();

  [[nodiscard]] const std::string& schema_version() const { return schema_version_; }
  [[nodiscard]] std::size_t size() const;

 private:
  static constexpr std::size_t kShardCount = 16;

  struct Shard {
    std::mutex mutex;
    std::unordered_map<std::string, AnalysisResult> results;
  };

  [[nodiscard]] Shard& ShardFor(const std::string& hash);
  [[nodiscard]] std::optional<AnalysisResult> LookupHash(const std::string& hash);
  void Store(const std::string& hash, const AnalysisResult& result);

  JournalDatabase& db_;
  std::string schema_version_;
  std::array<Shard, kShardCount> shards_{};
};

}  // namespace reminorcpp
