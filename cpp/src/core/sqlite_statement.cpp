#include "sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace reminorcpp::core {

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::ThrowOnBind(int rc) const {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
  }
}

Statement& Statement::BindText(int index, std::string_view value) {
  ThrowOnBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  return *this;
}

Statement& Statement::BindInt64(int index, std::int64_t value) {
  ThrowOnBind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  return *this;
}

Statement& Statement::BindBlob(int index, std::span<const std::uint8_t> value) {
  ThrowOnBind(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  return *this;
}

Statement& Statement::BindNull(int index) {
  ThrowOnBind(sqlite3_bind_null(stmt_, index));
  return *this;
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
}

void Statement::Run() {
  if (Step()) {
    throw std::runtime_error("sqlite statement returned unexpected rows");
  }
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string Statement::ColumnText(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  const int size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
}

std::optional<std::string> Statement::ColumnOptionalText(int column) const {
  if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColumnText(column);
}

std::int64_t Statement::ColumnInt64(int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::span<const std::uint8_t> Statement::ColumnBlob(int column) const {
  const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, column));
  const int size = sqlite3_column_bytes(stmt_, column);
  if (data == nullptr || size <= 0) {
    return {};
  }
  return std::span<const std::uint8_t>(data, static_cast<std::size_t>(size));
}

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw std::runtime_error(message);
}

void RunInTransaction(sqlite3* db, const std::function<void()>& body) {
  Exec(db, "BEGIN IMMEDIATE TRANSACTION;");
  try {
    body();
    Exec(db, "COMMIT;");
  } catch (const std::exception&) {
    if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::warn("sqlite rollback failed: {}", sqlite3_errmsg(db));
    }
    throw;
  }
}

}  // namespace reminorcpp::core
