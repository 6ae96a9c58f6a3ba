#include "reminorcpp/journal_engine.hpp"

#include "reminorcpp/engine_config.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace reminorcpp {
namespace {

constexpr const char* kBackupVersion = "1.0";

const EngineConfig& Validated(const EngineConfig& config) {
  ValidateEngineConfig(config);
  return config;
}

std::shared_ptr<LexicalSearchProvider> SelectLexicalProvider(const EngineConfig& config,
                                                             std::shared_ptr<LexicalSearchProvider> injected) {
  if (!config.enable_lexical_search) {
    return nullptr;
  }
  if (injected != nullptr) {
    return injected;
  }
  return std::make_shared<FTS5LexicalIndex>();
}

std::vector<LexicalDocument> LexicalDocuments(const JournalEntries& entries) {
  std::vector<LexicalDocument> documents{};
  documents.reserve(entries.size());
  for (const auto& [date, text] : entries) {
    documents.push_back(LexicalDocument{LexicalTitleFor(date), text});
  }
  return documents;
}

bool IsTextFile(const std::filesystem::path& path) {
  return core::ToLowerAscii(path.extension().string()) == ".txt";
}

ImportFileResult ErrorResult(std::string filename, std::string message) {
  ImportFileResult result{};
  result.filename = std::move(filename);
  result.status = ImportStatus::kError;
  result.message = std::move(message);
  return result;
}

}  // namespace

const char* ImportStatusName(ImportStatus status) {
  switch (status) {
    case ImportStatus::kImported:
      return "imported";
    case ImportStatus::kSkipped:
      return "skipped";
    case ImportStatus::kError:
      return "error";
  }
  return "error";
}

std::string LexicalTitleFor(const CalendarDate& date) {
  return "Diary " + ToIsoString(date);
}

JournalEngine::JournalEngine(const std::filesystem::path& path,
                             const EngineConfig& config,
                             EngineCollaborators collaborators)
    : config_(Validated(config)),
      today_(collaborators.today ? std::move(collaborators.today) : SystemDateProvider()),
      db_(path),
      entries_(db_),
      lexical_(SelectLexicalProvider(config_, std::move(collaborators.lexical))),
      vectors_(db_,
               config_.enable_vector_search ? std::move(collaborators.embedder) : nullptr,
               config_.retrieval.semantic_similarity_floor),
      entities_(config_.retrieval.entity_vocabulary, std::move(collaborators.recognizer)),
      matcher_(entries_, config_.retrieval),
      ranker_(entries_,
              matcher_,
              &entities_,
              vectors_.available() ? &vectors_ : nullptr,
              lexical_.get(),
              config_.retrieval),
      resolver_(today_),
      assembler_(entries_, resolver_, ranker_, config_.context),
      annotations_(db_),
      analysis_cache_(db_, config_.analysis.schema_version),
      analyzer_(analysis_cache_, std::move(collaborators.analyze), config_.analysis) {
  ConfigureLogging(config_.log_level);

  const auto all = entries_.All();
  vectors_.Load(all);
  PopulateLexicalLocked(all);
  entities_.Build(all);
  spdlog::info("journal engine: opened {} with {} entries (vector={}, lexical={})",
               db_.path(),
               all.size(),
               vectors_.available(),
               lexical_ != nullptr);
}

void JournalEngine::ThrowIfClosed() const {
  if (closed_) {
    throw std::runtime_error("journal engine is closed");
  }
}

void JournalEngine::PopulateLexicalLocked(const JournalEntries& entries) {
  if (lexical_ == nullptr) {
    return;
  }
  try {
    lexical_->Clear();
    lexical_->PutMany(LexicalDocuments(entries));
  } catch (const std::exception& error) {
    spdlog::warn("journal engine: lexical provider rejected the rebuild: {}", error.what());
  }
}

std::string JournalEngine::AssembleContext(const std::string& query) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return assembler_.Assemble(query);
}

std::string JournalEngine::AssembleContext(const std::string& query, int max_snippets) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return assembler_.Assemble(query, max_snippets);
}

std::vector<SearchHit> JournalEngine::Search(const std::string& query, int limit) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return ranker_.Search(query, limit);
}

bool JournalEngine::SaveEntry(const CalendarDate& date, const std::string& text) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  if (!entries_.Save(date, text)) {
    return false;
  }
  if (lexical_ != nullptr) {
    try {
      lexical_->Put(LexicalDocument{LexicalTitleFor(date), text});
    } catch (const std::exception& error) {
      spdlog::warn("journal engine: lexical provider rejected {}: {}", ToIsoString(date), error.what());
    }
  }
  if (vectors_.available() && !vectors_.Upsert(date, text)) {
    spdlog::warn("journal engine: no embedding stored for {}", ToIsoString(date));
  }
  entities_.Update(date, text);
  return true;
}

std::optional<std::string> JournalEngine::GetEntry(const CalendarDate& date) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return entries_.Get(date);
}

JournalEntries JournalEngine::Entries() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return entries_.All();
}

JournalEntries JournalEngine::Entries(const std::optional<CalendarDate>& start,
                                      const std::optional<CalendarDate>& end) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return entries_.Range(start, end);
}

bool JournalEngine::SaveAnnotation(const CalendarDate& date,
                                   const EmotionScores& emotions,
                                   const std::optional<Json::Value>& insights,
                                   const std::optional<Json::Value>& profile_updates) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return annotations_.Save(date, emotions, insights, profile_updates);
}

std::optional<AnnotationRecord> JournalEngine::LoadAnnotation(const CalendarDate& date) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return annotations_.Load(date);
}

std::map<CalendarDate, EmotionScores> JournalEngine::LoadEmotionsForDates(const std::vector<CalendarDate>& dates) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return annotations_.LoadEmotionsForDates(dates);
}

std::optional<AnalysisResult> JournalEngine::AnalyzeEntry(const CalendarDate& date) {
  std::optional<std::string> text{};
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ThrowIfClosed();
    text = entries_.Get(date);
  }
  if (!text.has_value()) {
    return std::nullopt;
  }

  // The analysis callback runs without the engine lock and may call back into the engine.
  auto result = analyzer_.Analyze(*text);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  if (!annotations_.Save(date, result.emotions, result.daily_insights, result.profile_updates)) {
    spdlog::warn("journal engine: analysis of {} produced no emotions", ToIsoString(date));
  }
  return result;
}

void JournalEngine::RebuildLocked() {
  entries_.Reload();
  const auto all = entries_.All();
  vectors_.Rebuild(all);
  PopulateLexicalLocked(all);
  entities_.Build(all);
  spdlog::info("journal engine: rebuilt indexes over {} entries", all.size());
}

void JournalEngine::RebuildIndexes() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  RebuildLocked();
}

ImportReport JournalEngine::ImportEntries(const std::vector<ImportItem>& items) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();

  ImportReport report{};
  const auto min_chars = static_cast<std::size_t>(config_.import_min_chars);
  for (const auto& item : items) {
    const auto label = item.filename.empty() ? item.date : item.filename;
    const auto date = ParseIsoDate(item.date);
    if (!date.has_value()) {
      report.files.push_back(ErrorResult(label, "invalid date '" + item.date + "', expected YYYY-MM-DD"));
      ++report.errors;
      continue;
    }

    ImportFileResult result{};
    result.filename = label;
    result.date = date;
    const auto content = core::Trim(item.content);
    if (core::Utf8Length(content) < min_chars) {
      result.status = ImportStatus::kSkipped;
      result.message = "content too short";
      report.files.push_back(std::move(result));
      ++report.skipped;
      continue;
    }
    if (!entries_.Save(*date, content)) {
      result.status = ImportStatus::kSkipped;
      result.message = "content is blank";
      report.files.push_back(std::move(result));
      ++report.skipped;
      continue;
    }
    result.status = ImportStatus::kImported;
    result.word_count = core::CountWhitespaceWords(content);
    result.message = "imported as " + ToIsoString(*date);
    report.files.push_back(std::move(result));
    ++report.imported;
  }

  if (report.imported > 0) {
    RebuildLocked();
  }
  spdlog::info("journal engine: import finished, {} imported, {} skipped, {} errors",
               report.imported,
               report.skipped,
               report.errors);
  return report;
}

ImportReport JournalEngine::ImportDirectory(const std::filesystem::path& directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw std::invalid_argument("import source is not a directory: " + directory.string());
  }

  std::vector<std::filesystem::path> files{};
  for (const auto& item : std::filesystem::directory_iterator(directory)) {
    const auto name = item.path().filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    if (!item.is_regular_file() || !IsTextFile(item.path())) {
      continue;
    }
    files.push_back(item.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<ImportItem> items{};
  std::vector<ImportFileResult> unreadable{};
  for (const auto& file : files) {
    const auto name = file.filename().string();
    const auto date = ParseFilenameDate(name);
    if (!date.has_value()) {
      spdlog::warn("journal engine: no date in file name '{}', skipping", name);
      unreadable.push_back(ErrorResult(name, "no date found in file name"));
      continue;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
      spdlog::warn("journal engine: cannot read '{}'", file.string());
      unreadable.push_back(ErrorResult(name, "cannot read file"));
      continue;
    }
    std::ostringstream buffer{};
    buffer << in.rdbuf();
    items.push_back(ImportItem{ToIsoString(*date), buffer.str(), name});
  }

  auto report = ImportEntries(items);
  report.errors += unreadable.size();
  report.files.insert(report.files.end(),
                      std::make_move_iterator(unreadable.begin()),
                      std::make_move_iterator(unreadable.end()));
  return report;
}

JournalStats JournalEngine::Stats() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return entries_.Stats(today_());
}

Json::Value JournalEngine::ExportBackup(bool include_emotions) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  const auto all = entries_.All();

  Json::Value backup{Json::objectValue};
  backup["version"] = kBackupVersion;
  backup["exported_at"] = ToIsoString(today_());
  Json::Value entries{Json::objectValue};
  std::vector<CalendarDate> dates{};
  dates.reserve(all.size());
  for (const auto& [date, text] : all) {
    entries[ToIsoString(date)] = text;
    dates.push_back(date);
  }
  backup["entries"] = std::move(entries);

  if (include_emotions) {
    Json::Value emotions{Json::objectValue};
    for (const auto& [date, scores] : annotations_.LoadEmotionsForDates(dates)) {
      if (scores.empty()) {
        continue;
      }
      Json::Value day{Json::objectValue};
      for (const auto& [emotion, score] : scores) {
        day[emotion] = static_cast<double>(score);
      }
      emotions[ToIsoString(date)] = std::move(day);
    }
    backup["emotions"] = std::move(emotions);
  }
  spdlog::debug("journal engine: exported backup with {} entries", all.size());
  return backup;
}

void JournalEngine::Close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  spdlog::info("journal engine: closed {}", db_.path());
}

}  // namespace reminorcpp
