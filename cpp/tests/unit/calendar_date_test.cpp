#include "reminorcpp/calendar_date.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void ScenarioIsoRoundTripAndOrdering() {
  reminorcpp::tests::Log("scenario: iso parse, format and ordering");
  const auto date = reminorcpp::ParseIsoDate("2024-06-15");
  Require(date.has_value(), "valid iso date should parse");
  Require(date->year == 2024 && date->month == 6 && date->day == 15, "iso fields mismatch");
  Require(reminorcpp::ToIsoString(*date) == "2024-06-15", "iso formatting mismatch");
  Require(reminorcpp::ToIsoString(reminorcpp::CalendarDate{7, 1, 2}) == "0007-01-02", "year should be zero padded");

  Require(reminorcpp::CalendarDate{2024, 6, 14} < reminorcpp::CalendarDate{2024, 6, 15}, "day ordering");
  Require(reminorcpp::CalendarDate{2023, 12, 31} < reminorcpp::CalendarDate{2024, 1, 1}, "year ordering");
}

void ScenarioStrictParsing() {
  reminorcpp::tests::Log("scenario: strict parsing rejects malformed input");
  Require(!reminorcpp::ParseIsoDate("2024-02-30").has_value(), "february 30 must be rejected");
  Require(!reminorcpp::ParseIsoDate("2023-02-29").has_value(), "non leap year february 29 must be rejected");
  Require(reminorcpp::ParseIsoDate("2024-02-29").has_value(), "leap day must be accepted");
  Require(!reminorcpp::ParseIsoDate("2024-6-15").has_value(), "short month must be rejected");
  Require(!reminorcpp::ParseIsoDate("2024/06/15").has_value(), "slashes must be rejected");
  Require(!reminorcpp::ParseIsoDate(" 2024-06-15").has_value(), "leading space must be rejected");
  Require(!reminorcpp::ParseIsoDate("2024_06_15").has_value(), "underscores are filename-only");

  bool threw = false;
  try {
    (void)reminorcpp::RequireIsoDate("yesterday");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "RequireIsoDate should throw invalid_argument");
}

void ScenarioArithmetic() {
  reminorcpp::tests::Log("scenario: day arithmetic");
  Require(reminorcpp::AddDays({2024, 3, 1}, -1) == reminorcpp::CalendarDate{2024, 2, 29}, "leap day step back");
  Require(reminorcpp::AddDays({2023, 12, 31}, 1) == reminorcpp::CalendarDate{2024, 1, 1}, "year rollover");
  Require(reminorcpp::DaysBetween({2024, 1, 1}, {2024, 12, 31}) == 365, "days in leap year span");
  Require(reminorcpp::DaysBetween({2024, 6, 16}, {2024, 6, 15}) == -1, "negative span");
  Require(reminorcpp::DaysInMonth(2100, 2) == 28, "2100 is not a leap year");
  Require(reminorcpp::DaysInMonth(2024, 13) == 0, "month 13 has no days");
}

void ScenarioEmbeddedDates() {
  reminorcpp::tests::Log("scenario: dates embedded in titles and file names");
  const auto title = reminorcpp::FindIsoDate("Diary 2024-06-15");
  Require(title.has_value() && *title == reminorcpp::CalendarDate{2024, 6, 15}, "title date mismatch");
  Require(!reminorcpp::FindIsoDate("Diary 12024-06-150").has_value(), "digit runs must be bounded");

  const auto dashed = reminorcpp::ParseFilenameDate("diary_2024-01-15.txt");
  Require(dashed.has_value() && *dashed == reminorcpp::CalendarDate{2024, 1, 15}, "dashed filename date");
  const auto underscored = reminorcpp::ParseFilenameDate("2024_01_15.txt");
  Require(underscored.has_value() && *underscored == reminorcpp::CalendarDate{2024, 1, 15},
          "underscored filename date");
  const auto day_first = reminorcpp::ParseFilenameDate("note 15-01-2024.txt");
  Require(day_first.has_value() && *day_first == reminorcpp::CalendarDate{2024, 1, 15}, "day first filename date");
  Require(!reminorcpp::ParseFilenameDate("2024-01_15.txt").has_value(), "mixed separators must be rejected");
  Require(!reminorcpp::ParseFilenameDate("notes.txt").has_value(), "no date in file name");
}

void ScenarioDateProvider() {
  reminorcpp::tests::Log("scenario: system date provider");
  const auto today = reminorcpp::SystemDateProvider()();
  Require(reminorcpp::IsValidDate(today.year, today.month, today.day), "system date should be valid");
}

}  // namespace

int main() {
  try {
    reminorcpp::tests::Log("calendar_date_test: start");
    ScenarioIsoRoundTripAndOrdering();
    ScenarioStrictParsing();
    ScenarioArithmetic();
    ScenarioEmbeddedDates();
    ScenarioDateProvider();
    reminorcpp::tests::Log("calendar_date_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    reminorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
