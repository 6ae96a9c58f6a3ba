#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace reminorcpp {

struct LexicalDocument {
  std::string title;
  std::string text;
};

struct LexicalHit {
  std::string title;
  std::string snippet;
  float score = 0.0f;
};

// Term-ranked full text search. Documents are keyed by title; putting an existing title replaces
// its text.
class LexicalSearchProvider {
 public:
  virtual ~LexicalSearchProvider() = default;

  virtual void Put(const LexicalDocument& document) = 0;
  virtual void PutMany(const std::vector<LexicalDocument>& documents) = 0;
  virtual void Clear() = 0;
  virtual std::vector<LexicalHit> Find(const std::string& query, int k) const = 0;
};

// In-memory SQLite FTS5 index. FTS5 MATCH selects candidates which are then ranked by TF-IDF
// over the candidate set. When FTS5 is unavailable the same ranking runs over every document.
class FTS5LexicalIndex final : public LexicalSearchProvider {
 public:
  FTS5LexicalIndex();
  ~FTS5LexicalIndex() override;
  FTS5LexicalIndex(const FTS5LexicalIndex&) = delete;
  FTS5LexicalIndex& operator=(const FTS5LexicalIndex&) = delete;

  void Put(const LexicalDocument& document) override;
  void PutMany(const std::vector<LexicalDocument>& documents) override;
  void Clear() override;
  std::vector<LexicalHit> Find(const std::string& query, int k) const override;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool fts_enabled() const;

 private:
  struct SQLiteState;

  void WriteLocked(const std::vector<LexicalDocument>& documents);
  void DisableFtsLocked(const char* context, const std::exception& error);

  std::unordered_map<std::string, std::string> docs_;
  std::unique_ptr<SQLiteState> sqlite_;
  mutable std::mutex mutex_{};
};

}  // namespace reminorcpp
