#include "reminorcpp/analysis_cache.hpp"

#include "../core/json_utils.hpp"
#include "../core/sha256.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace reminorcpp {

Json::Value AnalysisResultToJson(const AnalysisResult& result) {
  Json::Value out{Json::objectValue};
  Json::Value emotions{Json::objectValue};
  for (const auto& [name, score] : result.emotions) {
    emotions[name] = static_cast<double>(score);
  }
  out["emotions"] = emotions;
  out["daily_insights"] = result.daily_insights;
  out["profile_updates"] = result.profile_updates;
  return out;
}

AnalysisResult AnalysisResultFromJson(const Json::Value& value) {
  if (!value.isObject() || !value["emotions"].isObject()) {
    throw std::runtime_error("analysis result must be an object with an emotions object");
  }
  AnalysisResult out{};
  const auto& emotions = value["emotions"];
  for (const auto& name : emotions.getMemberNames()) {
    if (!emotions[name].isNumeric()) {
      throw std::runtime_error("analysis emotion '" + name + "' is not numeric");
    }
    out.emotions[name] = emotions[name].asFloat();
  }
  if (value.isMember("daily_insights")) {
    out.daily_insights = value["daily_insights"];
  }
  if (value.isMember("profile_updates")) {
    out.profile_updates = value["profile_updates"];
  }
  return out;
}

AnalysisCache::AnalysisCache(JournalDatabase& db, std::string schema_version)
    : db_(db), schema_version_(std::move(schema_version)) {
  if (schema_version_.empty()) {
    throw std::invalid_argument("AnalysisCache schema version must not be empty");
  }
  db_.WithSharedWrite([&]() {
    core::Statement purge(db_.handle(), "DELETE FROM analysis_cache WHERE schema_version <> ?1;");
    purge.BindText(1, schema_version_);
    purge.Run();
  });
  if (const int dropped = sqlite3_changes(db_.handle()); dropped > 0) {
    spdlog::info("analysis cache: dropped {} entries from older schema versions", dropped);
  }
}

AnalysisCache::Shard& AnalysisCache::ShardFor(const std::string& hash) {
  const auto nibble = hash.empty() ? 0U : static_cast<unsigned char>(hash.front());
  return shards_[nibble % kShardCount];
}

std::optional<AnalysisResult> AnalysisCache::LookupHash(const std::string& hash) {
  auto& shard = ShardFor(hash);
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    const auto it = shard.results.find(hash);
    if (it != shard.results.end()) {
      return it->second;
    }
  }

  core::Statement select(db_.handle(), "SELECT schema_version, result FROM analysis_cache WHERE content_hash = ?1;");
  select.BindText(1, hash);
  if (!select.Step()) {
    return std::nullopt;
  }
  if (select.ColumnText(0) != schema_version_) {
    return std::nullopt;
  }

  AnalysisResult result{};
  try {
    result = AnalysisResultFromJson(core::RequireJson(select.ColumnText(1), "analysis cache row"));
  } catch (const std::runtime_error& error) {
    spdlog::warn("analysis cache: corrupt entry ({}), invalidating the whole cache", error.what());
    InvalidateAll();
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.results.emplace(hash, result);
  return result;
}

void AnalysisCache::Store(const std::string& hash, const AnalysisResult& result) {
  const auto payload = core::WriteJson(AnalysisResultToJson(result));
  db_.WithSharedWrite([&]() {
    core::Statement upsert(db_.handle(),
                           "INSERT OR REPLACE INTO analysis_cache(content_hash, schema_version, result) "
                           "VALUES(?1, ?2, ?3);");
    upsert.BindText(1, hash).BindText(2, schema_version_).BindText(3, payload);
    upsert.Run();
  });
  auto& shard = ShardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.results[hash] = result;
}

AnalysisResult AnalysisCache::GetOrCompute(const std::string& text, const AnalysisFunction& compute) {
  const auto hash = core::Sha256Hex(text);
  if (auto cached = LookupHash(hash); cached.has_value()) {
    return *cached;
  }
  auto result = compute(text);
  Store(hash, result);
  return result;
}

std::optional<AnalysisResult> AnalysisCache::Lookup(const std::string& text) {
  return LookupHash(core::Sha256Hex(text));
}

void AnalysisCache::InvalidateAll() {
  db_.WithSharedWrite([&]() { core::Exec(db_.handle(), "DELETE FROM analysis_cache;"); });
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.results.clear();
  }
}

std::size_t AnalysisCache::size() const {
  core::Statement count(db_.handle(), "SELECT COUNT(*) FROM analysis_cache WHERE schema_version = ?1;");
  count.BindText(1, schema_version_);
  if (!count.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(count.ColumnInt64(0));
}

}  // namespace reminorcpp
