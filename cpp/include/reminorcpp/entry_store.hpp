#pragma once

#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace reminorcpp {

// Date-keyed journal text: the source of truth every index is derived from.
class EntryStore {
 public:
  explicit EntryStore(JournalDatabase& db);

  // Creates or overwrites the entry for `date`. Blank text is rejected and returns false.
  bool Save(const CalendarDate& date, const std::string& text);

  [[nodiscard]] std::optional<std::string> Get(const CalendarDate& date) const;
  [[nodiscard]] bool Contains(const CalendarDate& date) const;
  [[nodiscard]] JournalEntries All() const;
  // Inclusive bounds; an absent bound is open.
  [[nodiscard]] JournalEntries Range(const std::optional<CalendarDate>& start,
                                     const std::optional<CalendarDate>& end) const;
  [[nodiscard]] std::vector<CalendarDate> Dates() const;
  [[nodiscard]] std::size_t size() const;

  // Re-reads the table, picking up rows written outside this process.
  void Reload();

  [[nodiscard]] JournalStats Stats(const CalendarDate& today) const;

 private:
  [[nodiscard]] JournalEntries ReadAll() const;

  JournalDatabase& db_;
  JournalEntries entries_;
  mutable std::shared_mutex mutex_{};
};

}  // namespace reminorcpp
