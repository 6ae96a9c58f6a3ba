#include "reminorcpp/entity_index.hpp"

#include "../core/text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace reminorcpp {
namespace {

constexpr std::size_t kMinEntityLength = 3;

bool IsSentenceInitial(const std::string& text, std::size_t offset) {
  std::size_t pos = offset;
  while (pos > 0) {
    const char ch = text[pos - 1];
    if (ch == ' ' || ch == '\t' || ch == '"' || ch == '\'' || ch == '(') {
      --pos;
      continue;
    }
    return ch == '.' || ch == '!' || ch == '?' || ch == '\n' || ch == '\r';
  }
  return true;
}

bool IsEntityCandidate(const std::string& lower) {
  return core::Utf8Length(lower) >= kMinEntityLength && !core::IsStopword(lower) &&
         !core::MonthFromName(lower).has_value() && !core::IsWeekdayName(lower);
}

}  // namespace

EntityIndex::EntityIndex(std::vector<std::string> vocabulary, std::shared_ptr<EntityRecognizer> recognizer)
    : recognizer_(std::move(recognizer)), snapshot_(std::make_shared<const Snapshot>()) {
  for (auto& word : vocabulary) {
    vocabulary_.push_back(core::ToLowerAscii(word));
  }
}

EntityMentions EntityIndex::Extract(const std::string& text) const {
  const auto words = core::SplitWords(text, false);
  std::map<std::string, std::uint32_t> token_counts{};
  for (const auto& word : words) {
    token_counts[core::ToLowerAscii(word.text)] += 1U;
  }

  std::set<std::string> entities{};
  if (recognizer_ != nullptr) {
    try {
      for (const auto& entity : recognizer_->Recognize(text)) {
        if (entity.entity_class == EntityClass::kOther) {
          continue;
        }
        for (const auto& part : core::SplitWords(entity.text, false)) {
          const auto lower = core::ToLowerAscii(part.text);
          if (IsEntityCandidate(lower)) {
            entities.insert(lower);
          }
        }
      }
    } catch (const std::exception& error) {
      spdlog::warn("entity index: recognizer failed, using heuristics only: {}", error.what());
    }
  }

  // A capitalized word opening a sentence counts unless the entry also uses it in lower case.
  std::set<std::string> lowercase_uses{};
  for (const auto& word : words) {
    if (std::islower(static_cast<unsigned char>(word.text.front())) != 0) {
      lowercase_uses.insert(core::ToLowerAscii(word.text));
    }
  }
  for (const auto& word : words) {
    if (std::isupper(static_cast<unsigned char>(word.text.front())) == 0) {
      continue;
    }
    const auto lower = core::ToLowerAscii(word.text);
    if (IsSentenceInitial(text, word.offset) && lowercase_uses.count(lower) > 0) {
      continue;
    }
    if (IsEntityCandidate(lower)) {
      entities.insert(lower);
    }
  }

  for (const auto& word : vocabulary_) {
    if (token_counts.count(word) > 0) {
      entities.insert(word);
    }
  }

  EntityMentions mentions{};
  for (const auto& entity : entities) {
    const auto it = token_counts.find(entity);
    mentions[entity] = (it == token_counts.end()) ? 1U : std::max<std::uint32_t>(it->second, 1U);
  }
  return mentions;
}

void EntityIndex::Insert(Snapshot& snapshot, const CalendarDate& date, EntityMentions mentions) {
  for (const auto& [entity, count] : mentions) {
    snapshot.postings[entity][date] = count;
  }
  if (!mentions.empty()) {
    snapshot.by_date[date] = std::move(mentions);
  }
}

void EntityIndex::Remove(Snapshot& snapshot, const CalendarDate& date) {
  const auto it = snapshot.by_date.find(date);
  if (it == snapshot.by_date.end()) {
    return;
  }
  for (const auto& [entity, _] : it->second) {
    auto posting = snapshot.postings.find(entity);
    if (posting == snapshot.postings.end()) {
      continue;
    }
    posting->second.erase(date);
    if (posting->second.empty()) {
      snapshot.postings.erase(posting);
    }
  }
  snapshot.by_date.erase(it);
}

void EntityIndex::Build(const JournalEntries& entries) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto next = std::make_shared<Snapshot>();
  for (const auto& [date, text] : entries) {
    Insert(*next, date, Extract(text));
  }
  spdlog::info("entity index: {} entities over {} entries", next->postings.size(), entries.size());

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

void EntityIndex::Update(const CalendarDate& date, const std::string& text) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto mentions = Extract(text);
  auto next = std::make_shared<Snapshot>(*CurrentSnapshot());
  Remove(*next, date);
  Insert(*next, date, std::move(mentions));

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

std::shared_ptr<const EntityIndex::Snapshot> EntityIndex::CurrentSnapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

EntityDateCounts EntityIndex::Lookup(const std::vector<std::string>& tokens) const {
  const auto snapshot = CurrentSnapshot();
  EntityDateCounts out{};
  std::set<std::string> seen{};
  for (const auto& token : tokens) {
    const auto lower = core::ToLowerAscii(token);
    if (core::Utf8Length(lower) < kMinEntityLength || !seen.insert(lower).second) {
      continue;
    }
    const auto posting = snapshot->postings.find(lower);
    if (posting == snapshot->postings.end()) {
      continue;
    }
    for (const auto& [date, count] : posting->second) {
      out[date] += count;
    }
  }
  return out;
}

EntityDateCounts EntityIndex::LookupQuery(const std::string& query) const {
  std::vector<std::string> tokens{};
  for (auto& word : core::SplitWords(query, true)) {
    tokens.push_back(std::move(word.text));
  }
  return Lookup(tokens);
}

EntityMentions EntityIndex::MentionsFor(const CalendarDate& date) const {
  const auto snapshot = CurrentSnapshot();
  const auto it = snapshot->by_date.find(date);
  return it == snapshot->by_date.end() ? EntityMentions{} : it->second;
}

EntityDateCounts EntityIndex::DatesFor(const std::string& entity) const {
  const auto snapshot = CurrentSnapshot();
  const auto it = snapshot->postings.find(core::ToLowerAscii(entity));
  return it == snapshot->postings.end() ? EntityDateCounts{} : it->second;
}

std::size_t EntityIndex::entity_count() const {
  return CurrentSnapshot()->postings.size();
}

}  // namespace reminorcpp
