#pragma once

#include "reminorcpp/calendar_date.hpp"

#include <string>
#include <vector>

namespace reminorcpp {

// Resolves explicit date references in English or Italian free text:
//   "15 June", "June 15th", "15th of June", "15 giugno"   -> current year
//   "the 15th", "on the 15", "il 15"                      -> current month
//   "yesterday", "ieri"                                   -> today - 1
//   "today", "this morning", "tonight", "oggi", "stasera" -> today
// Dates are returned once each, in the order they appear. Impossible dates are skipped.
class TemporalQueryResolver {
 public:
  explicit TemporalQueryResolver(DateProvider today = SystemDateProvider());

  [[nodiscard]] std::vector<CalendarDate> Resolve(const std::string& query) const;

 private:
  DateProvider today_;
};

}  // namespace reminorcpp
