#include "reminorcpp/calendar_date.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace reminorcpp {
namespace {

bool IsDigit(char ch) {
  return ch >= '0' && ch <= '9';
}

std::optional<int> ParseDigits(std::string_view text, std::size_t offset, std::size_t count) {
  if (offset + count > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    if (!IsDigit(text[i])) {
      return std::nullopt;
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool IsSeparator(char ch, char expected) {
  return expected == '\0' ? (ch == '-' || ch == '_') : ch == expected;
}

// Digit runs must not continue past the matched window, otherwise "12024-01-015" would match.
bool BoundedAt(std::string_view text, std::size_t begin, std::size_t end) {
  if (begin > 0 && IsDigit(text[begin - 1])) {
    return false;
  }
  if (end < text.size() && IsDigit(text[end])) {
    return false;
  }
  return true;
}

std::optional<CalendarDate> MatchYearFirst(std::string_view text, std::size_t pos, char separator) {
  if (pos + 10 > text.size() || !BoundedAt(text, pos, pos + 10)) {
    return std::nullopt;
  }
  if (!IsSeparator(text[pos + 4], separator) || text[pos + 7] != text[pos + 4]) {
    return std::nullopt;
  }
  const auto year = ParseDigits(text, pos, 4);
  const auto month = ParseDigits(text, pos + 5, 2);
  const auto day = ParseDigits(text, pos + 8, 2);
  if (!year.has_value() || !month.has_value() || !day.has_value()) {
    return std::nullopt;
  }
  return MakeDate(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
}

std::optional<CalendarDate> MatchDayFirst(std::string_view text, std::size_t pos) {
  if (pos + 10 > text.size() || !BoundedAt(text, pos, pos + 10)) {
    return std::nullopt;
  }
  if (!IsSeparator(text[pos + 2], '\0') || text[pos + 5] != text[pos + 2]) {
    return std::nullopt;
  }
  const auto day = ParseDigits(text, pos, 2);
  const auto month = ParseDigits(text, pos + 3, 2);
  const auto year = ParseDigits(text, pos + 6, 4);
  if (!year.has_value() || !month.has_value() || !day.has_value()) {
    return std::nullopt;
  }
  return MakeDate(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
}

std::chrono::sys_days ToSysDays(const CalendarDate& date) {
  return std::chrono::sys_days{std::chrono::year{date.year} / std::chrono::month{date.month} /
                               std::chrono::day{date.day}};
}

CalendarDate FromSysDays(std::chrono::sys_days days) {
  const std::chrono::year_month_day ymd{days};
  return CalendarDate{
      static_cast<int>(ymd.year()),
      static_cast<unsigned>(ymd.month()),
      static_cast<unsigned>(ymd.day()),
  };
}

}  // namespace

unsigned DaysInMonth(int year, unsigned month) {
  if (month < 1 || month > 12) {
    return 0;
  }
  const auto last = std::chrono::year_month_day_last{std::chrono::year{year} / std::chrono::month{month} /
                                                     std::chrono::last};
  return static_cast<unsigned>(last.day());
}

bool IsValidDate(int year, unsigned month, unsigned day) {
  if (year < 1 || year > 9999) {
    return false;
  }
  const auto days = DaysInMonth(year, month);
  return days != 0 && day >= 1 && day <= days;
}

std::optional<CalendarDate> MakeDate(int year, unsigned month, unsigned day) {
  if (!IsValidDate(year, month, day)) {
    return std::nullopt;
  }
  return CalendarDate{year, month, day};
}

std::optional<CalendarDate> ParseIsoDate(std::string_view text) {
  if (text.size() != 10) {
    return std::nullopt;
  }
  return MatchYearFirst(text, 0, '-');
}

CalendarDate RequireIsoDate(std::string_view text) {
  const auto parsed = ParseIsoDate(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument("invalid calendar date: " + std::string(text));
  }
  return *parsed;
}

std::string ToIsoString(const CalendarDate& date) {
  char buffer[16] = {};
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
  return std::string(buffer);
}

CalendarDate AddDays(const CalendarDate& date, int days) {
  return FromSysDays(ToSysDays(date) + std::chrono::days{days});
}

int DaysBetween(const CalendarDate& from, const CalendarDate& to) {
  return static_cast<int>((ToSysDays(to) - ToSysDays(from)).count());
}

std::optional<CalendarDate> FindIsoDate(std::string_view text) {
  for (std::size_t pos = 0; pos + 10 <= text.size(); ++pos) {
    if (const auto date = MatchYearFirst(text, pos, '-'); date.has_value()) {
      return date;
    }
  }
  return std::nullopt;
}

std::optional<CalendarDate> ParseFilenameDate(std::string_view filename) {
  for (std::size_t pos = 0; pos + 10 <= filename.size(); ++pos) {
    if (const auto date = MatchYearFirst(filename, pos, '\0'); date.has_value()) {
      return date;
    }
  }
  for (std::size_t pos = 0; pos + 10 <= filename.size(); ++pos) {
    if (const auto date = MatchDayFirst(filename, pos); date.has_value()) {
      return date;
    }
  }
  return std::nullopt;
}

CalendarDate SystemToday() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
#if defined(_MSC_VER)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  return CalendarDate{
      local.tm_year + 1900,
      static_cast<unsigned>(local.tm_mon + 1),
      static_cast<unsigned>(local.tm_mday),
  };
}

DateProvider SystemDateProvider() {
  return []() { return SystemToday(); };
}

}  // namespace reminorcpp
