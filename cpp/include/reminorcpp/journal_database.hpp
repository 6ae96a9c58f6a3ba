#pragma once

#include <filesystem>
#include <functional>
#include <shared_mutex>
#include <string>

struct sqlite3;

namespace reminorcpp {

// Owns the SQLite connection shared by the entry, embedding, annotation and cache tables.
// The connection runs in serialized mode, so single statements may be issued from any thread.
class JournalDatabase {
 public:
  // ":memory:" opens a private in-memory database.
  explicit JournalDatabase(const std::filesystem::path& path);
  ~JournalDatabase();

  JournalDatabase(const JournalDatabase&) = delete;
  JournalDatabase& operator=(const JournalDatabase&) = delete;

  [[nodiscard]] sqlite3* handle() const { return db_; }
  [[nodiscard]] const std::string& path() const { return path_; }

  // Multi-statement work holds the transaction gate exclusively; single-row writers take it
  // shared so they never wait on each other.
  void WithTransaction(const std::function<void()>& body);
  void WithSharedWrite(const std::function<void()>& body);

 private:
  void CreateSchema();

  std::string path_;
  sqlite3* db_ = nullptr;
  std::shared_mutex transaction_gate_;
};

}  // namespace reminorcpp
