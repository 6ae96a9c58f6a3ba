#include "reminorcpp/entry_store.hpp"
#include "reminorcpp/journal_database.hpp"

#include "../../src/core/sqlite_statement.hpp"
#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniquePath() {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  // Nested so the database has to create its parent directory.
  return std::filesystem::temp_directory_path() /
         ("reminorcpp_entry_store_test_" + std::to_string(static_cast<long long>(now))) / "journal.db";
}

void ScenarioSaveGetAndOverwrite() {
  reminorcpp::tests::Log("scenario: save, get and overwrite");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::EntryStore store(db);
  const reminorcpp::CalendarDate date{2024, 6, 15};

  Require(!store.Get(date).has_value(), "missing entry is absent");
  Require(!store.Save(date, "  \n\t "), "blank text should be rejected");
  Require(!store.Contains(date), "rejected save stores nothing");

  Require(store.Save(date, "first draft"), "first save");
  Require(store.Save(date, "final text"), "overwrite");
  Require(store.Get(date) == std::optional<std::string>("final text"), "overwrite should replace the text");
  Require(store.size() == 1, "one entry per date");
}

void ScenarioRangeQueries() {
  reminorcpp::tests::Log("scenario: inclusive range queries");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::EntryStore store(db);
  for (unsigned day = 1; day <= 5; ++day) {
    Require(store.Save({2024, 3, day}, "day " + std::to_string(day)), "seed save");
  }
  Require(store.Range(reminorcpp::CalendarDate{2024, 3, 2}, reminorcpp::CalendarDate{2024, 3, 4}).size() == 3,
          "bounds are inclusive");
  Require(store.Range(std::nullopt, reminorcpp::CalendarDate{2024, 3, 2}).size() == 2, "open start");
  Require(store.Range(reminorcpp::CalendarDate{2024, 3, 4}, std::nullopt).size() == 2, "open end");
  Require(store.Range(std::nullopt, std::nullopt).size() == 5, "fully open range");
  Require(store.Range(reminorcpp::CalendarDate{2024, 3, 4}, reminorcpp::CalendarDate{2024, 3, 2}).empty(),
          "inverted range is empty");
  const auto dates = store.Dates();
  Require(dates.size() == 5 && dates.front() == reminorcpp::CalendarDate{2024, 3, 1}, "dates are ordered");
}

void ScenarioStats() {
  reminorcpp::tests::Log("scenario: words and streaks");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::EntryStore store(db);
  const auto empty = store.Stats({2024, 6, 16});
  Require(empty.total_entries == 0 && !empty.first_entry.has_value(), "empty journal has no stats");

  Require(store.Save({2024, 6, 1}, "one two three four"), "save");
  Require(store.Save({2024, 6, 2}, "one two"), "save");
  Require(store.Save({2024, 6, 3}, "one two three"), "save");
  Require(store.Save({2024, 6, 4}, "one"), "save");
  Require(store.Save({2024, 6, 15}, "one two three four five"), "save");
  Require(store.Save({2024, 6, 16}, "one  two\nthree"), "save");

  const auto stats = store.Stats({2024, 6, 16});
  Require(stats.total_entries == 6, "entry count");
  Require(stats.total_words == 18, "whitespace separated words");
  Require(stats.average_words == 3, "integer average");
  Require(stats.longest_streak == 4, "june 1 to 4 is the longest run");
  Require(stats.current_streak == 2, "june 15 and 16 end today");
  Require(stats.first_entry == reminorcpp::CalendarDate{2024, 6, 1}, "first entry");
  Require(stats.last_entry == reminorcpp::CalendarDate{2024, 6, 16}, "last entry");
  Require(store.Stats({2024, 6, 18}).current_streak == 0, "a gap before today breaks the current streak");
}

void ScenarioPersistenceAndReload() {
  reminorcpp::tests::Log("scenario: entries persist and reload picks up external rows");
  const auto path = UniquePath();
  std::error_code ec;
  try {
    {
      reminorcpp::JournalDatabase db(path);
      reminorcpp::EntryStore store(db);
      Require(store.Save({2024, 1, 1}, "new year"), "save");
    }
    reminorcpp::JournalDatabase db(path);
    reminorcpp::EntryStore store(db);
    Require(store.Get({2024, 1, 1}) == std::optional<std::string>("new year"), "entry should survive reopen");

    reminorcpp::core::Exec(db.handle(), "INSERT INTO entries(date, body) VALUES('2024-01-02', 'edited outside');");
    reminorcpp::core::Exec(db.handle(), "INSERT INTO entries(date, body) VALUES('not-a-date', 'garbage');");
    Require(!store.Contains({2024, 1, 2}), "external row is invisible before reload");
    store.Reload();
    Require(store.Get({2024, 1, 2}) == std::optional<std::string>("edited outside"), "reload picks up rows");
    Require(store.size() == 2, "rows with invalid dates are skipped");
    std::filesystem::remove_all(path.parent_path(), ec);
  } catch (const std::exception&) {
    std::filesystem::remove_all(path.parent_path(), ec);
    throw;
  }
}

}  // namespace

int main() {
  try {
    reminorcpp::tests::Log("entry_store_test: start");
    ScenarioSaveGetAndOverwrite();
    ScenarioRangeQueries();
    ScenarioStats();
    ScenarioPersistenceAndReload();
    reminorcpp::tests::Log("entry_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    reminorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
