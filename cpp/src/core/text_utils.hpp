#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reminorcpp::core {

struct WordToken {
  std::string text;
  std::size_t offset = 0;
};

// ASCII lowering; multi-byte UTF-8 sequences pass through unchanged.
[[nodiscard]] std::string ToLowerAscii(std::string_view text);

// Splits on anything that is not a letter (or digit when `keep_digits`). Bytes >= 0x80 count as
// letters so accented words stay whole. Offsets index the original text.
[[nodiscard]] std::vector<WordToken> SplitWords(std::string_view text, bool keep_digits);

[[nodiscard]] std::size_t Utf8Length(std::string_view text);

// Non-overlapping occurrences, like Python's str.count.
[[nodiscard]] std::size_t CountOccurrences(std::string_view haystack, std::string_view needle);

[[nodiscard]] std::string Trim(std::string_view text);
[[nodiscard]] bool IsBlank(std::string_view text);
[[nodiscard]] std::size_t CountWhitespaceWords(std::string_view text);

// Window of `before`/`after` bytes around `pos`, widened to UTF-8 boundaries, with "..." markers on
// each truncated side.
[[nodiscard]] std::string SnippetAround(std::string_view text, std::size_t pos, int before, int after);

// Leading `max_chars` bytes (UTF-8 safe) plus "..." when truncated.
[[nodiscard]] std::string Preview(std::string_view text, int max_chars);

// English + Italian function words, lower-case.
[[nodiscard]] bool IsStopword(std::string_view lower_word);

// Full month names in English and Italian.
[[nodiscard]] std::optional<unsigned> MonthFromName(std::string_view lower_word);
[[nodiscard]] bool IsWeekdayName(std::string_view lower_word);

}  // namespace reminorcpp::core
