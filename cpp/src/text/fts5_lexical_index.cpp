#include "reminorcpp/lexical_search.hpp"

#include "../core/sqlite_statement.hpp"
#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace reminorcpp {
namespace {

constexpr int kSnippetBefore = 60;
constexpr int kSnippetAfter = 240;

std::vector<std::string> QueryTokens(std::string_view text) {
  std::vector<std::string> tokens{};
  std::unordered_set<std::string> seen{};
  for (auto& token : core::SplitWords(core::ToLowerAscii(text), true)) {
    if (seen.insert(token.text).second) {
      tokens.push_back(std::move(token.text));
    }
  }
  return tokens;
}

std::unordered_map<std::string, std::uint32_t> TokenFreq(std::string_view text) {
  std::unordered_map<std::string, std::uint32_t> freq{};
  for (auto& token : core::SplitWords(core::ToLowerAscii(text), true)) {
    freq[std::move(token.text)] += 1U;
  }
  return freq;
}

std::string BuildFtsMatchQuery(const std::vector<std::string>& tokens) {
  std::string query{};
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      query.append(" OR ");
    }
    query.push_back('"');
    query.append(tokens[i]);
    query.push_back('"');
  }
  return query;
}

std::string SnippetForTokens(const std::string& text, const std::vector<std::string>& tokens) {
  const auto lower = core::ToLowerAscii(text);
  for (const auto& word : core::SplitWords(lower, true)) {
    if (std::find(tokens.begin(), tokens.end(), word.text) != tokens.end()) {
      return core::SnippetAround(text, word.offset, kSnippetBefore, kSnippetAfter);
    }
  }
  return core::Preview(text, kSnippetBefore + kSnippetAfter);
}

// TF-IDF over `candidates`, or over every document when `candidates` is null.
std::vector<LexicalHit> ScoreDocuments(const std::unordered_map<std::string, std::string>& docs,
                                       const std::vector<std::string>& tokens,
                                       int k,
                                       const std::unordered_set<std::string>* candidates) {
  std::unordered_map<std::string, std::uint32_t> doc_freq{};
  std::vector<std::pair<const std::string*, std::unordered_map<std::string, std::uint32_t>>> scored{};
  for (const auto& [title, text] : docs) {
    if (candidates != nullptr && candidates->count(title) == 0) {
      continue;
    }
    auto freq = TokenFreq(text);
    for (const auto& token : tokens) {
      if (freq.count(token) > 0) {
        doc_freq[token] += 1U;
      }
    }
    scored.emplace_back(&title, std::move(freq));
  }
  if (scored.empty()) {
    return {};
  }

  const double doc_count = static_cast<double>(scored.size());
  std::vector<LexicalHit> hits{};
  for (const auto& [title, freq] : scored) {
    double score = 0.0;
    for (const auto& token : tokens) {
      const auto tf = freq.find(token);
      if (tf == freq.end()) {
        continue;
      }
      const double df = static_cast<double>(doc_freq[token]);
      score += static_cast<double>(tf->second) * (std::log((doc_count + 1.0) / (df + 1.0)) + 1.0);
    }
    if (score <= 0.0) {
      continue;
    }
    hits.push_back(LexicalHit{*title, SnippetForTokens(docs.at(*title), tokens), static_cast<float>(score)});
  }

  std::sort(hits.begin(), hits.end(), [](const LexicalHit& lhs, const LexicalHit& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.title < rhs.title;
  });
  if (hits.size() > static_cast<std::size_t>(k)) {
    hits.resize(static_cast<std::size_t>(k));
  }
  return hits;
}

}  // namespace

struct FTS5LexicalIndex::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

FTS5LexicalIndex::FTS5LexicalIndex() {
  auto state = std::make_unique<SQLiteState>();
  if (sqlite3_open_v2(":memory:", &state->db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
    spdlog::warn("lexical index: sqlite unavailable, using full scan ranking");
    return;
  }
  try {
    core::Exec(state->db, "PRAGMA journal_mode=OFF;");
    core::Exec(state->db, "PRAGMA synchronous=OFF;");
    core::Exec(state->db,
               "CREATE TABLE docs("
               "id INTEGER PRIMARY KEY,"
               "title TEXT NOT NULL UNIQUE,"
               "body TEXT NOT NULL"
               ");");
    core::Exec(state->db,
               "CREATE VIRTUAL TABLE docs_fts USING fts5("
               "body,"
               "content='docs',"
               "content_rowid='id',"
               "tokenize='unicode61 remove_diacritics 0'"
               ");");
    core::Exec(state->db,
               "CREATE TRIGGER docs_ai AFTER INSERT ON docs BEGIN "
               "INSERT INTO docs_fts(rowid, body) VALUES(new.id, new.body); "
               "END;");
    core::Exec(state->db,
               "CREATE TRIGGER docs_ad AFTER DELETE ON docs BEGIN "
               "INSERT INTO docs_fts(docs_fts, rowid, body) VALUES('delete', old.id, old.body); "
               "END;");
    core::Exec(state->db,
               "CREATE TRIGGER docs_au AFTER UPDATE ON docs BEGIN "
               "INSERT INTO docs_fts(docs_fts, rowid, body) VALUES('delete', old.id, old.body); "
               "INSERT INTO docs_fts(rowid, body) VALUES(new.id, new.body); "
               "END;");
    sqlite_ = std::move(state);
  } catch (const std::exception& error) {
    spdlog::warn("lexical index: fts5 setup failed ({}), using full scan ranking", error.what());
  }
}

FTS5LexicalIndex::~FTS5LexicalIndex() = default;

void FTS5LexicalIndex::DisableFtsLocked(const char* context, const std::exception& error) {
  spdlog::warn("lexical index: {} failed ({}), falling back to full scan ranking", context, error.what());
  sqlite_.reset();
}

void FTS5LexicalIndex::WriteLocked(const std::vector<LexicalDocument>& documents) {
  for (const auto& document : documents) {
    docs_[document.title] = document.text;
  }
  if (sqlite_ == nullptr) {
    return;
  }
  try {
    core::RunInTransaction(sqlite_->db, [&]() {
      core::Statement upsert(sqlite_->db,
                             "INSERT INTO docs(title, body) VALUES(?1, ?2) "
                             "ON CONFLICT(title) DO UPDATE SET body=excluded.body;");
      for (const auto& document : documents) {
        upsert.Reset();
        upsert.BindText(1, document.title).BindText(2, document.text);
        upsert.Run();
      }
    });
  } catch (const std::exception& error) {
    DisableFtsLocked("put", error);
  }
}

void FTS5LexicalIndex::Put(const LexicalDocument& document) {
  std::lock_guard<std::mutex> lock(mutex_);
  WriteLocked({document});
}

void FTS5LexicalIndex::PutMany(const std::vector<LexicalDocument>& documents) {
  std::lock_guard<std::mutex> lock(mutex_);
  WriteLocked(documents);
}

void FTS5LexicalIndex::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  docs_.clear();
  if (sqlite_ == nullptr) {
    return;
  }
  try {
    core::Exec(sqlite_->db, "DELETE FROM docs;");
  } catch (const std::exception& error) {
    DisableFtsLocked("clear", error);
  }
}

std::vector<LexicalHit> FTS5LexicalIndex::Find(const std::string& query, int k) const {
  if (k < 0) {
    throw std::invalid_argument("FTS5LexicalIndex::Find k must be non-negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (k == 0 || docs_.empty()) {
    return {};
  }
  const auto tokens = QueryTokens(query);
  if (tokens.empty()) {
    return {};
  }

  if (sqlite_ != nullptr) {
    std::unordered_set<std::string> candidates{};
    try {
      core::Statement select(sqlite_->db,
                             "SELECT docs.title FROM docs_fts JOIN docs ON docs.id = docs_fts.rowid "
                             "WHERE docs_fts MATCH ?1;");
      select.BindText(1, BuildFtsMatchQuery(tokens));
      while (select.Step()) {
        candidates.insert(select.ColumnText(0));
      }
      return ScoreDocuments(docs_, tokens, k, &candidates);
    } catch (const std::exception& error) {
      spdlog::debug("lexical index: fts5 query failed ({}), scanning all documents", error.what());
    }
  }
  return ScoreDocuments(docs_, tokens, k, nullptr);
}

std::size_t FTS5LexicalIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return docs_.size();
}

bool FTS5LexicalIndex::fts_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sqlite_ != nullptr;
}

}  // namespace reminorcpp
