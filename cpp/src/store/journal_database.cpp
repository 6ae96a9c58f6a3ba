#include "reminorcpp/journal_database.hpp"

#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace reminorcpp {

JournalDatabase::JournalDatabase(const std::filesystem::path& path) : path_(path.string()) {
  if (path_.empty()) {
    throw std::invalid_argument("JournalDatabase path must not be empty");
  }
  if (path_ != ":memory:" && path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  const int rc = sqlite3_open_v2(path_.c_str(),
                                 &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("failed to open journal database '" + path_ + "': " + message);
  }

  try {
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite busy timeout failed: ") + sqlite3_errmsg(db_));
    }
    CreateSchema();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::debug("journal database opened: {}", path_);
}

JournalDatabase::~JournalDatabase() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void JournalDatabase::CreateSchema() {
  core::Exec(db_, "PRAGMA foreign_keys=OFF;");
  if (path_ != ":memory:") {
    core::Exec(db_, "PRAGMA journal_mode=WAL;");
  }
  core::Exec(db_,
             "CREATE TABLE IF NOT EXISTS entries("
             "date TEXT PRIMARY KEY,"
             "body TEXT NOT NULL"
             ");");
  core::Exec(db_,
             "CREATE TABLE IF NOT EXISTS embeddings("
             "date TEXT PRIMARY KEY,"
             "content_hash TEXT NOT NULL,"
             "dims INTEGER NOT NULL,"
             "vector BLOB NOT NULL"
             ");");
  core::Exec(db_,
             "CREATE TABLE IF NOT EXISTS annotations("
             "date TEXT PRIMARY KEY,"
             "emotions TEXT NOT NULL,"
             "insights TEXT,"
             "profile_updates TEXT,"
             "version INTEGER NOT NULL DEFAULT 1,"
             "updated_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
             ");");
  core::Exec(db_,
             "CREATE TABLE IF NOT EXISTS analysis_cache("
             "content_hash TEXT PRIMARY KEY,"
             "schema_version TEXT NOT NULL,"
             "result TEXT NOT NULL"
             ");");
}

void JournalDatabase::WithTransaction(const std::function<void()>& body) {
  std::unique_lock lock(transaction_gate_);
  core::RunInTransaction(db_, body);
}

void JournalDatabase::WithSharedWrite(const std::function<void()>& body) {
  std::shared_lock lock(transaction_gate_);
  body();
}

}  // namespace reminorcpp
