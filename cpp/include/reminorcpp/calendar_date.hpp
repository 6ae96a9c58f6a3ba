#pragma once

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace reminorcpp {

struct CalendarDate {
  int year = 1970;
  unsigned month = 1;
  unsigned day = 1;

  auto operator<=>(const CalendarDate&) const = default;
};

using DateProvider = std::function<CalendarDate()>;

[[nodiscard]] bool IsValidDate(int year, unsigned month, unsigned day);
[[nodiscard]] std::optional<CalendarDate> MakeDate(int year, unsigned month, unsigned day);
[[nodiscard]] unsigned DaysInMonth(int year, unsigned month);

// Strict YYYY-MM-DD.
[[nodiscard]] std::optional<CalendarDate> ParseIsoDate(std::string_view text);
// Same as ParseIsoDate but throws std::invalid_argument.
[[nodiscard]] CalendarDate RequireIsoDate(std::string_view text);
[[nodiscard]] std::string ToIsoString(const CalendarDate& date);

[[nodiscard]] CalendarDate AddDays(const CalendarDate& date, int days);
[[nodiscard]] int DaysBetween(const CalendarDate& from, const CalendarDate& to);

// First YYYY-MM-DD occurrence anywhere inside `text`.
[[nodiscard]] std::optional<CalendarDate> FindIsoDate(std::string_view text);

// Accepts YYYY-MM-DD, YYYY_MM_DD, DD-MM-YYYY and DD_MM_YYYY embedded in a file name.
[[nodiscard]] std::optional<CalendarDate> ParseFilenameDate(std::string_view filename);

[[nodiscard]] CalendarDate SystemToday();
[[nodiscard]] DateProvider SystemDateProvider();

}  // namespace reminorcpp
