#pragma once

#include "reminorcpp/analysis_cache.hpp"
#include "reminorcpp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reminorcpp {

class EmotionAnalyzer {
 public:
  // `analyze` may be empty, in which case only the keyword analysis runs.
  EmotionAnalyzer(AnalysisCache& cache, AnalysisFunction analyze, AnalysisConfig config);

  [[nodiscard]] AnalysisResult Analyze(const std::string& text);
  [[nodiscard]] bool has_external_analysis() const { return static_cast<bool>(analyze_); }

  [[nodiscard]] static const std::vector<std::string>& StandardEmotions();
  [[nodiscard]] static AnalysisResult EmptyAnalysis();
  // Every standard emotion present; missing ones become 0, others are dropped; scores clamped.
  [[nodiscard]] static EmotionScores ValidateEmotions(const EmotionScores& emotions);
  // Each matched English or Italian keyword adds 0.3 to its emotion, capped at 1.
  [[nodiscard]] static EmotionScores KeywordAnalysis(const std::string& text);

 private:
  AnalysisCache& cache_;
  AnalysisFunction analyze_;
  AnalysisConfig config_;
};

// Highest scoring emotion if it is above 0.2.
[[nodiscard]] std::optional<std::string> DominantEmotion(const EmotionScores& emotions);

}  // namespace reminorcpp
