#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace reminorcpp::core {
namespace {

bool IsContinuationByte(unsigned char ch) {
  return (ch & 0xC0U) == 0x80U;
}

bool IsWordByte(unsigned char ch, bool keep_digits) {
  if (ch >= 0x80U) {
    return true;
  }
  if (std::isalpha(ch) != 0) {
    return true;
  }
  return keep_digits && std::isdigit(ch) != 0;
}

const std::unordered_set<std::string>& Stopwords() {
  static const std::unordered_set<std::string> kStopwords = {
      // English
      "a", "about", "after", "again", "all", "also", "am", "an", "and", "any", "are", "as", "at",
      "be", "been", "before", "being", "but", "by", "can", "could", "did", "do", "does", "doing",
      "done", "for", "from", "had", "has", "have", "having", "he", "her", "here", "hers", "him",
      "his", "how", "i", "if", "in", "into", "is", "it", "its", "just", "know", "me", "more",
      "most", "my", "no", "not", "now", "of", "on", "once", "only", "or", "other", "our", "ours",
      "out", "over", "she", "should", "so", "some", "such", "tell", "than", "that", "the",
      "their", "them", "then", "there", "these", "they", "this", "those", "through", "to",
      "too", "under", "until", "up", "very", "was", "we", "were", "what", "when", "where",
      "which", "while", "who", "whom", "why", "will", "with", "would", "you", "your", "yours",
      "about", "remember", "today", "yesterday", "tonight", "morning", "evening",
      // Italian
      "il", "lo", "la", "gli", "le", "un", "uno", "una", "dei", "degli", "delle", "di", "da",
      "in", "con", "su", "per", "tra", "fra", "ad", "al", "alla", "allo", "ai", "agli", "alle",
      "dal", "dalla", "dallo", "dai", "dagli", "dalle", "del", "della", "dello", "nel",
      "nella", "nello", "nei", "negli", "nelle", "col", "coi", "sul", "sulla", "sullo", "sui",
      "sugli", "sulle", "che", "chi", "cosa", "come", "dove", "quando", "perché", "perche",
      "ed", "ma", "se", "non", "più", "piu", "anche", "solo", "mi", "ti", "ci", "vi", "si",
      "me", "te", "lui", "lei", "noi", "voi", "loro", "mio", "mia", "tuo", "tua", "suo", "sua",
      "nostro", "nostra", "questo", "questa", "quello", "quella", "quale", "quanto", "tutto",
      "ogni", "conosci", "sai", "dimmi", "parlami", "raccontami", "dici", "sono", "sei", "era",
      "ero", "erano", "essere", "stato", "stata", "ho", "hai", "ha", "abbiamo", "avete",
      "hanno", "avevo", "aveva", "avere", "fatto", "fare", "poi", "prima", "dopo", "ancora",
      "sempre", "mai", "molto", "poco", "oggi", "ieri", "domani", "stamattina", "stasera",
      "stanotte", "allora", "quindi", "però", "pero", "cioè", "cioe", "qualcosa", "niente",
      "successo", "accaduto",
  };
  return kStopwords;
}

const std::unordered_map<std::string, unsigned>& MonthNames() {
  static const std::unordered_map<std::string, unsigned> kMonths = {
      {"january", 1},  {"february", 2}, {"march", 3},     {"april", 4},    {"may", 5},
      {"june", 6},     {"july", 7},     {"august", 8},    {"september", 9}, {"october", 10},
      {"november", 11}, {"december", 12},
      {"gennaio", 1},  {"febbraio", 2}, {"marzo", 3},     {"aprile", 4},   {"maggio", 5},
      {"giugno", 6},   {"luglio", 7},   {"agosto", 8},    {"settembre", 9}, {"ottobre", 10},
      {"novembre", 11}, {"dicembre", 12},
  };
  return kMonths;
}

const std::unordered_set<std::string>& WeekdayNames() {
  static const std::unordered_set<std::string> kWeekdays = {
      "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
      "lunedì", "martedì", "mercoledì", "giovedì", "venerdì", "sabato", "domenica",
      "lunedi", "martedi", "mercoledi", "giovedi", "venerdi",
  };
  return kWeekdays;
}

}  // namespace

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return ch < 0x80U ? static_cast<char>(std::tolower(ch)) : static_cast<char>(ch);
  });
  return out;
}

std::vector<WordToken> SplitWords(std::string_view text, bool keep_digits) {
  std::vector<WordToken> tokens{};
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && !IsWordByte(static_cast<unsigned char>(text[pos]), keep_digits)) {
      ++pos;
    }
    if (pos >= text.size()) {
      break;
    }
    std::size_t end = pos;
    while (end < text.size() && IsWordByte(static_cast<unsigned char>(text[end]), keep_digits)) {
      ++end;
    }
    tokens.push_back(WordToken{std::string(text.substr(pos, end - pos)), pos});
    pos = end;
  }
  return tokens;
}

std::size_t Utf8Length(std::string_view text) {
  std::size_t count = 0;
  for (const unsigned char ch : text) {
    if (!IsContinuationByte(ch)) {
      ++count;
    }
  }
  return count;
}

std::size_t CountOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::size_t CountWhitespaceWords(std::string_view text) {
  std::size_t count = 0;
  bool in_word = false;
  for (const unsigned char ch : text) {
    if (std::isspace(ch) != 0) {
      in_word = false;
      continue;
    }
    if (!in_word) {
      ++count;
      in_word = true;
    }
  }
  return count;
}

std::string SnippetAround(std::string_view text, std::size_t pos, int before, int after) {
  if (text.empty()) {
    return {};
  }
  pos = std::min(pos, text.size());
  std::size_t start = pos > static_cast<std::size_t>(std::max(before, 0))
                          ? pos - static_cast<std::size_t>(std::max(before, 0))
                          : 0;
  std::size_t end = std::min(text.size(), pos + static_cast<std::size_t>(std::max(after, 0)));
  while (start > 0 && IsContinuationByte(static_cast<unsigned char>(text[start]))) {
    --start;
  }
  while (end < text.size() && IsContinuationByte(static_cast<unsigned char>(text[end]))) {
    ++end;
  }

  std::string out{};
  if (start > 0) {
    out.append("...");
  }
  out.append(text.substr(start, end - start));
  if (end < text.size()) {
    out.append("...");
  }
  return out;
}

std::string Preview(std::string_view text, int max_chars) {
  if (max_chars <= 0) {
    return {};
  }
  if (text.size() <= static_cast<std::size_t>(max_chars)) {
    return std::string(text);
  }
  std::size_t end = static_cast<std::size_t>(max_chars);
  while (end > 0 && IsContinuationByte(static_cast<unsigned char>(text[end]))) {
    --end;
  }
  return std::string(text.substr(0, end)) + "...";
}

bool IsStopword(std::string_view lower_word) {
  return Stopwords().count(std::string(lower_word)) > 0;
}

std::optional<unsigned> MonthFromName(std::string_view lower_word) {
  const auto& months = MonthNames();
  const auto it = months.find(std::string(lower_word));
  if (it == months.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool IsWeekdayName(std::string_view lower_word) {
  return WeekdayNames().count(std::string(lower_word)) > 0;
}

}  // namespace reminorcpp::core
