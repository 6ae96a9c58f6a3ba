#include "reminorcpp/emotion_analyzer.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace reminorcpp {
namespace {

constexpr float kKeywordIncrement = 0.3f;
constexpr float kDominantThreshold = 0.2f;

const std::map<std::string, std::vector<std::string>>& EmotionKeywords() {
  static const std::map<std::string, std::vector<std::string>> kKeywords = {
      {"happy", {"happy", "glad", "joy", "joyful", "wonderful", "felice", "contento", "contenta", "gioia",
                 "fantastico", "ottimo"}},
      {"sad", {"sad", "unhappy", "depressed", "cried", "crying", "grief", "triste", "depresso", "depressa",
               "dolore", "piango", "sconforto"}},
      {"angry", {"angry", "furious", "rage", "hate", "irritated", "arrabbiato", "arrabbiata", "furioso",
                 "rabbia", "odio", "irritato"}},
      {"anxious", {"anxious", "anxiety", "worried", "nervous", "agitated", "ansioso", "ansiosa", "ansia",
                   "preoccupato", "preoccupata", "nervoso", "agitato"}},
      {"serene", {"serene", "calm", "peaceful", "relaxed", "sereno", "serena", "calmo", "tranquillo", "pace",
                  "rilassato"}},
      {"stressed", {"stressed", "stress", "pressure", "overwhelmed", "stressato", "stressata", "pressione",
                    "sovraccarico"}},
      {"grateful", {"grateful", "thankful", "thanks", "lucky", "grato", "grata", "grazie", "riconoscente",
                    "apprezzo", "fortuna"}},
      {"motivated", {"motivated", "determined", "energy", "goal", "motivato", "motivata", "determinato",
                     "energia", "voglia", "obiettivo"}},
  };
  return kKeywords;
}

float Clamp01(float value) {
  if (std::isnan(value)) {
    return 0.0f;
  }
  return std::clamp(value, 0.0f, 1.0f);
}

}  // namespace

EmotionAnalyzer::EmotionAnalyzer(AnalysisCache& cache, AnalysisFunction analyze, AnalysisConfig config)
    : cache_(cache), analyze_(std::move(analyze)), config_(std::move(config)) {}

const std::vector<std::string>& EmotionAnalyzer::StandardEmotions() {
  static const std::vector<std::string> kEmotions = {
      "happy", "sad", "angry", "anxious", "serene", "stressed", "grateful", "motivated",
  };
  return kEmotions;
}

AnalysisResult EmotionAnalyzer::EmptyAnalysis() {
  AnalysisResult out{};
  for (const auto& emotion : StandardEmotions()) {
    out.emotions[emotion] = 0.0f;
  }
  return out;
}

EmotionScores EmotionAnalyzer::ValidateEmotions(const EmotionScores& emotions) {
  EmotionScores out{};
  for (const auto& emotion : StandardEmotions()) {
    const auto it = emotions.find(emotion);
    out[emotion] = it == emotions.end() ? 0.0f : Clamp01(it->second);
  }
  return out;
}

EmotionScores EmotionAnalyzer::KeywordAnalysis(const std::string& text) {
  std::set<std::string> words{};
  for (auto& word : core::SplitWords(core::ToLowerAscii(text), false)) {
    words.insert(std::move(word.text));
  }
  auto scores = EmptyAnalysis().emotions;
  for (const auto& [emotion, keywords] : EmotionKeywords()) {
    for (const auto& keyword : keywords) {
      if (words.count(keyword) > 0) {
        scores[emotion] = std::min(scores[emotion] + kKeywordIncrement, 1.0f);
      }
    }
  }
  return scores;
}

AnalysisResult EmotionAnalyzer::Analyze(const std::string& text) {
  const auto trimmed = core::Trim(text);
  if (core::Utf8Length(trimmed) < static_cast<std::size_t>(std::max(config_.min_text_chars, 0))) {
    return EmptyAnalysis();
  }
  const auto input = core::Preview(trimmed, config_.max_text_chars);

  if (analyze_) {
    try {
      return cache_.GetOrCompute(input, [this](const std::string& value) {
        auto result = analyze_(value);
        result.emotions = ValidateEmotions(result.emotions);
        return result;
      });
    } catch (const std::exception& error) {
      spdlog::warn("emotion analyzer: external analysis failed, using keyword analysis: {}", error.what());
    }
  }

  AnalysisResult fallback{};
  fallback.emotions = KeywordAnalysis(input);
  return fallback;
}

std::optional<std::string> DominantEmotion(const EmotionScores& emotions) {
  const auto best = std::max_element(emotions.begin(), emotions.end(),
                                     [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });
  if (best == emotions.end() || best->second <= kDominantThreshold) {
    return std::nullopt;
  }
  return best->first;
}

}  // namespace reminorcpp
