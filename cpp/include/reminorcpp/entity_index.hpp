#pragma once

#include "reminorcpp/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace reminorcpp {

enum class EntityClass {
  kPerson,
  kPlace,
  kOrganization,
  kOther,
};

struct NamedEntity {
  std::string text;
  EntityClass entity_class = EntityClass::kOther;
};

// Optional named-entity recognizer (an NLP model behind some adapter).
class EntityRecognizer {
 public:
  virtual ~EntityRecognizer() = default;
  virtual std::vector<NamedEntity> Recognize(const std::string& text) = 0;
};

using EntityMentions = std::map<std::string, std::uint32_t>;
using EntityDateCounts = std::map<CalendarDate, std::uint32_t>;

// Inverted index entity -> date -> occurrence count. The index is immutable between writes:
// Build and Update assemble a new snapshot and swap it in.
class EntityIndex {
 public:
  EntityIndex(std::vector<std::string> vocabulary, std::shared_ptr<EntityRecognizer> recognizer = nullptr);

  void Build(const JournalEntries& entries);
  // Replaces the mentions recorded for `date`.
  void Update(const CalendarDate& date, const std::string& text);

  // Counts summed per date over every token of length >= 3 present in the index.
  [[nodiscard]] EntityDateCounts Lookup(const std::vector<std::string>& tokens) const;
  [[nodiscard]] EntityDateCounts LookupQuery(const std::string& query) const;

  [[nodiscard]] EntityMentions Extract(const std::string& text) const;
  [[nodiscard]] EntityMentions MentionsFor(const CalendarDate& date) const;
  [[nodiscard]] EntityDateCounts DatesFor(const std::string& entity) const;
  [[nodiscard]] std::size_t entity_count() const;

 private:
  struct Snapshot {
    std::map<std::string, EntityDateCounts> postings;
    std::map<CalendarDate, EntityMentions> by_date;
  };

  [[nodiscard]] std::shared_ptr<const Snapshot> CurrentSnapshot() const;
  static void Insert(Snapshot& snapshot, const CalendarDate& date, EntityMentions mentions);
  static void Remove(Snapshot& snapshot, const CalendarDate& date);

  std::vector<std::string> vocabulary_;
  std::shared_ptr<EntityRecognizer> recognizer_;
  std::shared_ptr<const Snapshot> snapshot_;
  mutable std::mutex snapshot_mutex_{};
  std::mutex writer_mutex_{};
};

}  // namespace reminorcpp
