#include "reminorcpp/embeddings.hpp"
#include "reminorcpp/journal_database.hpp"
#include "reminorcpp/vector_index.hpp"

#include "../../src/core/sha256.hpp"
#include "../test_logger.hpp"

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniquePath() {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("reminorcpp_vector_index_test_" + std::to_string(static_cast<long long>(now)) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

// One axis per topic word: apple, car, sea.
class TopicEmbedder final : public reminorcpp::EmbeddingProvider {
 public:
  int dimensions() const override { return 3; }

  std::vector<float> Embed(const std::string& text) override {
    ++calls;
    std::vector<float> out{0.0F, 0.0F, 0.0F};
    if (text.find("apple") != std::string::npos) {
      out[0] = 1.0F;
    }
    if (text.find("car") != std::string::npos) {
      out[1] = 1.0F;
    }
    if (text.find("sea") != std::string::npos) {
      out[2] = 1.0F;
    }
    return out;
  }

  std::atomic<int> calls{0};
};

class ThrowingEmbedder final : public reminorcpp::EmbeddingProvider {
 public:
  int dimensions() const override { return 3; }
  std::vector<float> Embed(const std::string& /*text*/) override { throw std::runtime_error("provider offline"); }
};

void ScenarioQueryRanksByCosine() {
  reminorcpp::tests::Log("scenario: cosine ranking with a similarity floor");
  reminorcpp::JournalDatabase db(":memory:");
  auto embedder = std::make_shared<TopicEmbedder>();
  reminorcpp::VectorIndex index(db, embedder, 0.2F);
  Require(index.available(), "index with an embedder should be available");

  Require(index.Upsert({2024, 6, 1}, "picked an apple"), "upsert apple");
  Require(index.Upsert({2024, 6, 2}, "washed the car"), "upsert car");
  Require(index.Upsert({2024, 6, 3}, "apple pie in the car"), "upsert mixed");
  Require(index.size() == 3, "three vectors expected");

  const auto matches = index.Query("apple", 10);
  Require(matches.size() == 2, "orthogonal car entry must fall under the floor");
  Require(matches[0].date == reminorcpp::CalendarDate{2024, 6, 1}, "exact topic first");
  Require(std::fabs(matches[0].similarity - 1.0F) < 1e-5F, "exact topic similarity is 1");
  Require(std::fabs(matches[1].similarity - std::sqrt(0.5F)) < 1e-4F, "mixed entry similarity");

  Require(index.Query("apple", 1).size() == 1, "k should truncate");
  Require(index.Query("apple", 0).empty(), "k = 0 yields nothing");
  Require(index.Query("nothing relevant", 5).empty(), "zero query vector matches nothing");

  bool threw = false;
  try {
    (void)index.Query("apple", -1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "negative k should throw invalid_argument");
}

void ScenarioUpsertIsIdempotent() {
  reminorcpp::tests::Log("scenario: unchanged text is not re-embedded");
  reminorcpp::JournalDatabase db(":memory:");
  auto embedder = std::make_shared<TopicEmbedder>();
  reminorcpp::VectorIndex index(db, embedder, 0.2F);

  Require(index.Upsert({2024, 6, 1}, "picked an apple"), "first upsert");
  const int calls_after_first = embedder->calls.load();
  Require(index.Upsert({2024, 6, 1}, "picked an apple"), "second upsert");
  Require(embedder->calls.load() == calls_after_first, "identical text should not call the embedder");
  Require(index.size() == 1, "still one vector");
  Require(index.ContentHash({2024, 6, 1}) == reminorcpp::core::Sha256Hex("picked an apple"),
          "content hash should track the entry text");

  Require(index.Upsert({2024, 6, 1}, "drove the car"), "overwrite upsert");
  const auto matches = index.Query("car", 5);
  Require(matches.size() == 1 && matches[0].date == reminorcpp::CalendarDate{2024, 6, 1},
          "overwritten entry should match its new text");
  Require(index.Query("apple", 5).empty(), "stale vector must be gone");
}

void ScenarioMissingOrFailingProvider() {
  reminorcpp::tests::Log("scenario: missing or failing provider degrades to empty");
  reminorcpp::JournalDatabase db(":memory:");
  reminorcpp::VectorIndex disabled(db, nullptr, 0.2F);
  Require(!disabled.available(), "null embedder disables the index");
  Require(!disabled.Upsert({2024, 1, 1}, "apple"), "upsert without embedder stores nothing");
  Require(disabled.Query("apple", 5).empty(), "query without embedder is empty");
  disabled.Rebuild({{{2024, 1, 1}, "apple"}});
  Require(disabled.size() == 0, "rebuild without embedder is a no-op");

  reminorcpp::JournalDatabase db2(":memory:");
  auto healthy = std::make_shared<TopicEmbedder>();
  {
    reminorcpp::VectorIndex index(db2, healthy, 0.2F);
    Require(index.Upsert({2024, 1, 1}, "apple"), "healthy upsert");
  }
  reminorcpp::VectorIndex failing(db2, std::make_shared<ThrowingEmbedder>(), 0.2F);
  Require(failing.Load({{{2024, 1, 1}, "apple"}}) == 0, "persisted vector should be reused without embedding");
  Require(failing.Contains({2024, 1, 1}), "persisted vector should load");
  Require(failing.Query("apple", 5).empty(), "query embedding failure yields nothing");
  Require(!failing.Upsert({2024, 1, 1}, "apple changed"), "failed upsert reports false");
  Require(!failing.Contains({2024, 1, 1}), "stale vector must be dropped when re-embedding fails");
}

void ScenarioPersistenceAndStaleRegeneration() {
  reminorcpp::tests::Log("scenario: vectors persist and stale ones regenerate on load");
  const auto path = UniquePath();
  RemoveDatabase(path);
  try {
    reminorcpp::JournalEntries entries{};
    entries[{2024, 6, 1}] = "picked an apple";
    entries[{2024, 6, 2}] = "washed the car";
    {
      reminorcpp::JournalDatabase db(path);
      reminorcpp::VectorIndex index(db, std::make_shared<TopicEmbedder>(), 0.2F);
      Require(index.Load(entries) == 2, "first load embeds everything");
    }

    entries[{2024, 6, 2}] = "swam in the sea";
    entries[{2024, 6, 3}] = "another apple";
    {
      reminorcpp::JournalDatabase db(path);
      auto embedder = std::make_shared<TopicEmbedder>();
      reminorcpp::VectorIndex index(db, embedder, 0.2F);
      Require(index.Load(entries) == 2, "changed and missing vectors regenerate");
      Require(embedder->calls.load() == 2, "unchanged vector should be reused");
      const auto sea = index.Query("sea", 5);
      Require(sea.size() == 1 && sea[0].date == reminorcpp::CalendarDate{2024, 6, 2}, "regenerated vector is live");
      Require(index.Query("car", 5).empty(), "stale car vector must not survive");
    }

    {
      reminorcpp::JournalDatabase db(path);
      const char* sql = "UPDATE embeddings SET vector = x'00010203' WHERE date = '2024-06-01';";
      Require(sqlite3_exec(db.handle(), sql, nullptr, nullptr, nullptr) == SQLITE_OK, "corrupt blob");
      auto embedder = std::make_shared<TopicEmbedder>();
      reminorcpp::VectorIndex index(db, embedder, 0.2F);
      Require(index.Load(entries) == 1, "undecodable blob is treated as missing");
      Require(index.size() == 3, "all entries covered after load");
    }
    RemoveDatabase(path);
  } catch (const std::exception&) {
    RemoveDatabase(path);
    throw;
  }
}

void ScenarioRebuildSwapsWholeIndex() {
  reminorcpp::tests::Log("scenario: rebuild replaces the whole index");
  reminorcpp::JournalDatabase db(":memory:");
  auto embedder = std::make_shared<reminorcpp::HashingEmbedder>();
  reminorcpp::VectorIndex index(db, embedder, 0.0F);
  Require(index.Upsert({2024, 1, 1}, "old entry about mountains"), "seed upsert");

  reminorcpp::JournalEntries entries{};
  entries[{2024, 2, 1}] = "sailing on the lake with friends";
  entries[{2024, 2, 2}] = "reading about lake ecosystems";
  index.Rebuild(entries);
  Require(index.size() == 2, "rebuild should drop dates no longer present");
  Require(!index.Contains({2024, 1, 1}), "old date must be gone");
  const auto matches = index.Query("lake", 5);
  Require(matches.size() == 2, "both lake entries should match");
}

}  // namespace

int main() {
  try {
    reminorcpp::tests::Log("vector_index_test: start");
    ScenarioQueryRanksByCosine();
    ScenarioUpsertIsIdempotent();
    ScenarioMissingOrFailingProvider();
    ScenarioPersistenceAndStaleRegeneration();
    ScenarioRebuildSwapsWholeIndex();
    reminorcpp::tests::Log("vector_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    reminorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
