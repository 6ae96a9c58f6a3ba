#pragma once

#include "reminorcpp/embeddings.hpp"
#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reminorcpp {

struct VectorMatch {
  CalendarDate date{};
  float similarity = 0.0f;
};

// Per-date embeddings, persisted in the `embeddings` table and queried by cosine similarity.
// Queries read an immutable snapshot; writers build a new one and swap it in, so a query never
// observes a half-rebuilt index.
class VectorIndex {
 public:
  // A null embedder leaves the index permanently empty; every call degrades to a no-op.
  VectorIndex(JournalDatabase& db, std::shared_ptr<EmbeddingProvider> embedder, float similarity_floor);

  [[nodiscard]] bool available() const { return embedder_ != nullptr; }

  // Loads persisted vectors, then regenerates those that are missing, undecodable or stale with
  // respect to `entries`. Returns how many vectors were (re)generated.
  std::size_t Load(const JournalEntries& entries);

  // Embeds and durably stores the vector before returning. Returns false when no vector could be
  // produced; any previous vector for `date` is dropped in that case.
  bool Upsert(const CalendarDate& date, const std::string& text);

  // Top-k dates whose similarity exceeds the floor, best first.
  [[nodiscard]] std::vector<VectorMatch> Query(const std::string& text, int k) const;

  // Recomputes every vector from `entries` and replaces the table and the snapshot at once.
  void Rebuild(const JournalEntries& entries);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool Contains(const CalendarDate& date) const;
  [[nodiscard]] std::optional<std::string> ContentHash(const CalendarDate& date) const;

 private:
  struct Record {
    std::string content_hash;
    std::shared_ptr<const std::vector<float>> vector;
  };
  using Snapshot = std::map<CalendarDate, Record>;

  [[nodiscard]] std::shared_ptr<const Snapshot> CurrentSnapshot() const;
  void Publish(std::shared_ptr<const Snapshot> next);
  [[nodiscard]] std::optional<std::vector<float>> TryEmbed(const std::string& text) const;
  [[nodiscard]] std::vector<std::optional<std::vector<float>>> EmbedAll(
      const std::vector<std::string>& texts) const;
  [[nodiscard]] Snapshot ReadPersisted() const;
  void Persist(const CalendarDate& date, const Record& record);
  void Erase(const CalendarDate& date);

  JournalDatabase& db_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  float similarity_floor_ = 0.0f;
  std::shared_ptr<const Snapshot> snapshot_;
  mutable std::mutex snapshot_mutex_{};
  std::mutex writer_mutex_{};
};

}  // namespace reminorcpp
