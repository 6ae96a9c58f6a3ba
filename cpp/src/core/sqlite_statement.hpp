#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace reminorcpp::core {

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] sqlite3_stmt* get() const { return stmt_; }

  Statement& BindText(int index, std::string_view value);
  Statement& BindInt64(int index, std::int64_t value);
  Statement& BindBlob(int index, std::span<const std::uint8_t> value);
  Statement& BindNull(int index);

  // True while a row is available; throws on any code other than ROW/DONE.
  [[nodiscard]] bool Step();
  // Runs a statement that must not return rows.
  void Run();
  void Reset();

  [[nodiscard]] std::string ColumnText(int column) const;
  [[nodiscard]] std::optional<std::string> ColumnOptionalText(int column) const;
  [[nodiscard]] std::int64_t ColumnInt64(int column) const;
  [[nodiscard]] std::span<const std::uint8_t> ColumnBlob(int column) const;

 private:
  void ThrowOnBind(int rc) const;

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql);

// BEGIN IMMEDIATE / COMMIT around `body`; rolls back and rethrows when `body` or COMMIT throws.
void RunInTransaction(sqlite3* db, const std::function<void()>& body);

}  // namespace reminorcpp::core
