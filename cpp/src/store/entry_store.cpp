#include "reminorcpp/entry_store.hpp"

#include "../core/sqlite_statement.hpp"
#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace reminorcpp {

EntryStore::EntryStore(JournalDatabase& db) : db_(db), entries_(ReadAll()) {}

JournalEntries EntryStore::ReadAll() const {
  JournalEntries out{};
  core::Statement select(db_.handle(), "SELECT date, body FROM entries;");
  while (select.Step()) {
    const auto raw_date = select.ColumnText(0);
    const auto date = ParseIsoDate(raw_date);
    if (!date.has_value()) {
      spdlog::warn("entry store: skipping row with invalid date '{}'", raw_date);
      continue;
    }
    out.emplace(*date, select.ColumnText(1));
  }
  return out;
}

bool EntryStore::Save(const CalendarDate& date, const std::string& text) {
  if (core::IsBlank(text)) {
    return false;
  }
  const auto key = ToIsoString(date);
  db_.WithSharedWrite([&]() {
    core::Statement upsert(db_.handle(),
                           "INSERT INTO entries(date, body) VALUES(?1, ?2) "
                           "ON CONFLICT(date) DO UPDATE SET body=excluded.body;");
    upsert.BindText(1, key).BindText(2, text);
    upsert.Run();
  });

  std::unique_lock lock(mutex_);
  entries_[date] = text;
  return true;
}

std::optional<std::string> EntryStore::Get(const CalendarDate& date) const {
  std::shared_lock lock(mutex_);
  const auto it = entries_.find(date);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool EntryStore::Contains(const CalendarDate& date) const {
  std::shared_lock lock(mutex_);
  return entries_.count(date) > 0;
}

JournalEntries EntryStore::All() const {
  std::shared_lock lock(mutex_);
  return entries_;
}

JournalEntries EntryStore::Range(const std::optional<CalendarDate>& start,
                                 const std::optional<CalendarDate>& end) const {
  std::shared_lock lock(mutex_);
  auto first = start.has_value() ? entries_.lower_bound(*start) : entries_.begin();
  auto last = end.has_value() ? entries_.upper_bound(*end) : entries_.end();
  if (start.has_value() && end.has_value() && *end < *start) {
    return {};
  }
  return JournalEntries(first, last);
}

std::vector<CalendarDate> EntryStore::Dates() const {
  std::shared_lock lock(mutex_);
  std::vector<CalendarDate> dates{};
  dates.reserve(entries_.size());
  for (const auto& [date, _] : entries_) {
    dates.push_back(date);
  }
  return dates;
}

std::size_t EntryStore::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void EntryStore::Reload() {
  auto fresh = ReadAll();
  std::unique_lock lock(mutex_);
  entries_ = std::move(fresh);
}

JournalStats EntryStore::Stats(const CalendarDate& today) const {
  std::shared_lock lock(mutex_);
  JournalStats stats{};
  stats.total_entries = entries_.size();
  if (entries_.empty()) {
    return stats;
  }

  for (const auto& [_, text] : entries_) {
    stats.total_words += core::CountWhitespaceWords(text);
  }
  stats.average_words = stats.total_words / stats.total_entries;
  stats.first_entry = entries_.begin()->first;
  stats.last_entry = entries_.rbegin()->first;

  int run = 0;
  std::optional<CalendarDate> previous{};
  for (const auto& [date, _] : entries_) {
    run = (previous.has_value() && DaysBetween(*previous, date) == 1) ? run + 1 : 1;
    stats.longest_streak = std::max(stats.longest_streak, run);
    previous = date;
  }

  CalendarDate cursor = today;
  while (entries_.count(cursor) > 0) {
    ++stats.current_streak;
    cursor = AddDays(cursor, -1);
  }
  return stats;
}

}  // namespace reminorcpp
