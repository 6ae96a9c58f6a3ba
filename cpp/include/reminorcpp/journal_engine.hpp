#pragma once

#include "reminorcpp/analysis_cache.hpp"
#include "reminorcpp/annotation_store.hpp"
#include "reminorcpp/context_assembler.hpp"
#include "reminorcpp/embeddings.hpp"
#include "reminorcpp/emotion_analyzer.hpp"
#include "reminorcpp/entity_index.hpp"
#include "reminorcpp/entry_store.hpp"
#include "reminorcpp/fusion_ranker.hpp"
#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/lexical_search.hpp"
#include "reminorcpp/temporal_resolver.hpp"
#include "reminorcpp/text_matcher.hpp"
#include "reminorcpp/types.hpp"
#include "reminorcpp/vector_index.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace reminorcpp {

// Every collaborator is optional. A missing lexical provider is replaced by the built-in FTS5
// index unless lexical search is disabled in the config.
struct EngineCollaborators {
  std::shared_ptr<EmbeddingProvider> embedder;
  std::shared_ptr<LexicalSearchProvider> lexical;
  std::shared_ptr<EntityRecognizer> recognizer;
  AnalysisFunction analyze;
  DateProvider today;
};

struct ImportItem {
  std::string date;
  std::string content;
  std::string filename;
};

enum class ImportStatus {
  kImported,
  kSkipped,
  kError,
};

struct ImportFileResult {
  std::string filename;
  std::optional<CalendarDate> date;
  ImportStatus status = ImportStatus::kError;
  std::size_t word_count = 0;
  std::string message;
};

struct ImportReport {
  std::vector<ImportFileResult> files;
  std::size_t imported = 0;
  std::size_t skipped = 0;
  std::size_t errors = 0;
};

[[nodiscard]] const char* ImportStatusName(ImportStatus status);

// Journal-level lexical document title, "Diary YYYY-MM-DD".
[[nodiscard]] std::string LexicalTitleFor(const CalendarDate& date);

class JournalEngine {
 public:
  JournalEngine(const std::filesystem::path& path,
                const EngineConfig& config,
                EngineCollaborators collaborators = {});

  JournalEngine(const JournalEngine&) = delete;
  JournalEngine& operator=(const JournalEngine&) = delete;

  [[nodiscard]] std::string AssembleContext(const std::string& query);
  [[nodiscard]] std::string AssembleContext(const std::string& query, int max_snippets);
  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query, int limit);

  // Stores the entry and refreshes every index for that date. Blank text returns false.
  bool SaveEntry(const CalendarDate& date, const std::string& text);
  [[nodiscard]] std::optional<std::string> GetEntry(const CalendarDate& date);
  [[nodiscard]] JournalEntries Entries();
  [[nodiscard]] JournalEntries Entries(const std::optional<CalendarDate>& start,
                                       const std::optional<CalendarDate>& end);

  bool SaveAnnotation(const CalendarDate& date,
                      const EmotionScores& emotions,
                      const std::optional<Json::Value>& insights = std::nullopt,
                      const std::optional<Json::Value>& profile_updates = std::nullopt);
  [[nodiscard]] std::optional<AnnotationRecord> LoadAnnotation(const CalendarDate& date);
  [[nodiscard]] std::map<CalendarDate, EmotionScores> LoadEmotionsForDates(const std::vector<CalendarDate>& dates);

  // Analyzes the stored entry and saves the result as its annotation. Absent when there is no
  // entry for `date`. The analysis function runs without the engine lock.
  std::optional<AnalysisResult> AnalyzeEntry(const CalendarDate& date);

  // Re-reads entries and rebuilds the vector, lexical and entity indexes from scratch.
  void RebuildIndexes();

  ImportReport ImportEntries(const std::vector<ImportItem>& items);
  // Imports every dated *.txt file directly inside `directory`. Throws std::invalid_argument when
  // `directory` is not a directory.
  ImportReport ImportDirectory(const std::filesystem::path& directory);

  [[nodiscard]] JournalStats Stats();

  // Backup document: {"version", "exported_at", "entries": {date: text}} plus, when requested,
  // "emotions": {date: scores} for every annotated entry.
  [[nodiscard]] Json::Value ExportBackup(bool include_emotions = true);

  [[nodiscard]] const EngineConfig& config() const { return config_; }
  [[nodiscard]] bool vector_search_available() const { return vectors_.available(); }
  [[nodiscard]] bool lexical_search_available() const { return lexical_ != nullptr; }

  void Close();

 private:
  void PopulateLexicalLocked(const JournalEntries& entries);
  void RebuildLocked();
  void ThrowIfClosed() const;

  EngineConfig config_;
  DateProvider today_;
  JournalDatabase db_;
  EntryStore entries_;
  std::shared_ptr<LexicalSearchProvider> lexical_;
  VectorIndex vectors_;
  EntityIndex entities_;
  DirectTextMatcher matcher_;
  FusionRanker ranker_;
  TemporalQueryResolver resolver_;
  ContextAssembler assembler_;
  AnnotationStore annotations_;
  AnalysisCache analysis_cache_;
  EmotionAnalyzer analyzer_;
  bool closed_ = false;
  mutable std::shared_mutex mutex_{};
};

}  // namespace reminorcpp
