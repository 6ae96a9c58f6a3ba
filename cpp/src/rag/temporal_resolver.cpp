#include "reminorcpp/temporal_resolver.hpp"

#include "../core/text_utils.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <utility>

namespace reminorcpp {
namespace {

std::optional<unsigned> ParseDayToken(const std::string& token) {
  std::size_t digits = 0;
  while (digits < token.size() && token[digits] >= '0' && token[digits] <= '9') {
    ++digits;
  }
  if (digits == 0 || digits > 2) {
    return std::nullopt;
  }
  const auto suffix = token.substr(digits);
  if (!suffix.empty() && suffix != "st" && suffix != "nd" && suffix != "rd" && suffix != "th") {
    return std::nullopt;
  }
  const auto day = static_cast<unsigned>(std::stoi(token.substr(0, digits)));
  if (day < 1 || day > 31) {
    return std::nullopt;
  }
  return day;
}

bool IsTodayWord(const std::string& token) {
  static const std::unordered_set<std::string> kWords = {
      "today", "tonight", "oggi", "stamattina", "stamani", "stasera", "stanotte", "stamane",
  };
  return kWords.count(token) > 0;
}

bool IsDayPart(const std::string& token) {
  static const std::unordered_set<std::string> kParts = {
      "morning", "afternoon", "evening", "night", "mattina", "pomeriggio", "sera", "notte",
  };
  return kParts.count(token) > 0;
}

bool IsThisWord(const std::string& token) {
  return token == "this" || token == "questa" || token == "questo";
}

}  // namespace

TemporalQueryResolver::TemporalQueryResolver(DateProvider today) : today_(std::move(today)) {
  if (!today_) {
    today_ = SystemDateProvider();
  }
}

std::vector<CalendarDate> TemporalQueryResolver::Resolve(const std::string& query) const {
  const auto words = core::SplitWords(core::ToLowerAscii(query), true);
  std::vector<std::string> tokens{};
  tokens.reserve(words.size());
  for (const auto& word : words) {
    tokens.push_back(word.text);
  }

  const CalendarDate today = today_();
  std::vector<CalendarDate> out{};
  auto emit_date = [&](const CalendarDate& date) {
    if (std::find(out.begin(), out.end(), date) == out.end()) {
      out.push_back(date);
    }
  };
  auto emit = [&](int year, unsigned month, unsigned day) {
    if (const auto date = MakeDate(year, month, day); date.has_value()) {
      emit_date(*date);
    }
  };
  auto token_at = [&](std::size_t index) -> const std::string* {
    return index < tokens.size() ? &tokens[index] : nullptr;
  };

  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const auto& token = tokens[i];

    if (token == "yesterday" || token == "ieri") {
      emit_date(AddDays(today, -1));
      continue;
    }
    if (IsTodayWord(token)) {
      emit_date(today);
      continue;
    }
    if (IsThisWord(token)) {
      if (const auto* next = token_at(i + 1); next != nullptr && IsDayPart(*next)) {
        emit_date(today);
        ++i;
      }
      continue;
    }

    if (const auto day = ParseDayToken(token); day.has_value()) {
      const auto* next = token_at(i + 1);
      if (next != nullptr) {
        if (const auto month = core::MonthFromName(*next); month.has_value()) {
          emit(today.year, *month, *day);
          ++i;
          continue;
        }
        const auto* after = token_at(i + 2);
        if (*next == "of" && after != nullptr) {
          if (const auto month = core::MonthFromName(*after); month.has_value()) {
            emit(today.year, *month, *day);
            i += 2;
            continue;
          }
        }
      }
      if (i > 0 && (tokens[i - 1] == "the" || tokens[i - 1] == "il")) {
        emit(today.year, today.month, *day);
      }
      continue;
    }

    if (const auto month = core::MonthFromName(token); month.has_value()) {
      if (const auto* next = token_at(i + 1); next != nullptr) {
        if (const auto day = ParseDayToken(*next); day.has_value()) {
          emit(today.year, *month, *day);
          ++i;
        }
      }
    }
  }
  return out;
}

}  // namespace reminorcpp
