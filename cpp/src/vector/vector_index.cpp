#include "reminorcpp/vector_index.hpp"

#include "../core/sha256.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>

namespace reminorcpp {
namespace {

inline constexpr std::array<std::uint8_t, 6> kVectorBlobMagic = {'R', 'M', 'V', 'E', 'C', '1'};

void AppendU32LE(std::vector<std::uint8_t>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendF32LE(std::vector<std::uint8_t>& out, float value) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32LE(out, bits);
}

std::vector<std::uint8_t> EncodeVectorBlob(const std::vector<float>& vector) {
  if (vector.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error("embedding vector length exceeds uint32");
  }
  std::vector<std::uint8_t> out{};
  out.reserve(kVectorBlobMagic.size() + 4 + vector.size() * sizeof(float));
  out.insert(out.end(), kVectorBlobMagic.begin(), kVectorBlobMagic.end());
  AppendU32LE(out, static_cast<std::uint32_t>(vector.size()));
  for (const float value : vector) {
    AppendF32LE(out, value);
  }
  return out;
}

std::optional<std::vector<float>> DecodeVectorBlob(std::span<const std::uint8_t> blob) {
  if (blob.size() < kVectorBlobMagic.size() + 4) {
    return std::nullopt;
  }
  if (!std::equal(kVectorBlobMagic.begin(), kVectorBlobMagic.end(), blob.begin())) {
    return std::nullopt;
  }
  std::size_t cursor = kVectorBlobMagic.size();
  auto read_u32 = [&]() {
    std::uint32_t out = 0;
    for (std::size_t i = 0; i < 4; ++i) {
      out |= static_cast<std::uint32_t>(blob[cursor + i]) << (8U * i);
    }
    cursor += 4;
    return out;
  };
  const auto dims = read_u32();
  if (blob.size() != cursor + static_cast<std::size_t>(dims) * sizeof(float)) {
    return std::nullopt;
  }
  std::vector<float> out(dims, 0.0F);
  for (auto& value : out) {
    const auto bits = read_u32();
    std::memcpy(&value, &bits, sizeof(value));
  }
  return out;
}

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  if (lhs.size() != rhs.size()) {
    return 0.0F;
  }
  const auto lhs_norm = std::sqrt(std::max(Dot(lhs, lhs), 0.0F));
  const auto rhs_norm = std::sqrt(std::max(Dot(rhs, rhs), 0.0F));
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return Dot(lhs, rhs) / (lhs_norm * rhs_norm);
}

}  // namespace

VectorIndex::VectorIndex(JournalDatabase& db, std::shared_ptr<EmbeddingProvider> embedder, float similarity_floor)
    : db_(db),
      embedder_(std::move(embedder)),
      similarity_floor_(similarity_floor),
      snapshot_(std::make_shared<const Snapshot>()) {
  if (embedder_ == nullptr) {
    spdlog::info("vector index: no embedding provider, semantic search disabled");
  }
}

std::shared_ptr<const VectorIndex::Snapshot> VectorIndex::CurrentSnapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

void VectorIndex::Publish(std::shared_ptr<const Snapshot> next) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

std::optional<std::vector<float>> VectorIndex::TryEmbed(const std::string& text) const {
  try {
    auto vector = embedder_->Embed(text);
    if (vector.empty() || static_cast<int>(vector.size()) != embedder_->dimensions()) {
      spdlog::warn("vector index: embedder returned {} dims, expected {}", vector.size(), embedder_->dimensions());
      return std::nullopt;
    }
    return vector;
  } catch (const std::exception& error) {
    spdlog::warn("vector index: embedding failed: {}", error.what());
    return std::nullopt;
  }
}

std::vector<std::optional<std::vector<float>>> VectorIndex::EmbedAll(const std::vector<std::string>& texts) const {
  std::vector<std::optional<std::vector<float>>> out{};
  out.reserve(texts.size());
  if (auto* batch = dynamic_cast<BatchEmbeddingProvider*>(embedder_.get()); batch != nullptr && texts.size() > 1) {
    try {
      auto vectors = batch->EmbedBatch(texts);
      if (vectors.size() != texts.size()) {
        throw std::runtime_error("mismatched embedding batch size");
      }
      for (auto& vector : vectors) {
        if (static_cast<int>(vector.size()) == embedder_->dimensions()) {
          out.emplace_back(std::move(vector));
        } else {
          out.emplace_back(std::nullopt);
        }
      }
      return out;
    } catch (const std::exception& error) {
      spdlog::warn("vector index: batch embedding failed ({}), embedding one by one", error.what());
      out.clear();
    }
  }
  for (const auto& text : texts) {
    out.push_back(TryEmbed(text));
  }
  return out;
}

VectorIndex::Snapshot VectorIndex::ReadPersisted() const {
  Snapshot out{};
  core::Statement select(db_.handle(), "SELECT date, content_hash, vector FROM embeddings;");
  while (select.Step()) {
    const auto date = ParseIsoDate(select.ColumnText(0));
    if (!date.has_value()) {
      continue;
    }
    auto vector = DecodeVectorBlob(select.ColumnBlob(2));
    if (!vector.has_value() || static_cast<int>(vector->size()) != embedder_->dimensions()) {
      spdlog::warn("vector index: discarding undecodable vector for {}", ToIsoString(*date));
      continue;
    }
    out.emplace(*date, Record{select.ColumnText(1), std::make_shared<const std::vector<float>>(std::move(*vector))});
  }
  return out;
}

void VectorIndex::Persist(const CalendarDate& date, const Record& record) {
  const auto blob = EncodeVectorBlob(*record.vector);
  db_.WithSharedWrite([&]() {
    core::Statement upsert(db_.handle(),
                           "INSERT OR REPLACE INTO embeddings(date, content_hash, dims, vector) "
                           "VALUES(?1, ?2, ?3, ?4);");
    upsert.BindText(1, ToIsoString(date))
        .BindText(2, record.content_hash)
        .BindInt64(3, static_cast<std::int64_t>(record.vector->size()))
        .BindBlob(4, blob);
    upsert.Run();
  });
}

void VectorIndex::Erase(const CalendarDate& date) {
  db_.WithSharedWrite([&]() {
    core::Statement remove(db_.handle(), "DELETE FROM embeddings WHERE date = ?1;");
    remove.BindText(1, ToIsoString(date));
    remove.Run();
  });
}

std::size_t VectorIndex::Load(const JournalEntries& entries) {
  if (!available()) {
    return 0;
  }
  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto persisted = ReadPersisted();

  Snapshot next{};
  std::size_t regenerated = 0;
  for (const auto& [date, text] : entries) {
    const auto hash = core::Sha256Hex(text);
    const auto it = persisted.find(date);
    if (it != persisted.end() && it->second.content_hash == hash) {
      next.emplace(date, std::move(it->second));
      continue;
    }
    auto vector = TryEmbed(text);
    if (!vector.has_value()) {
      continue;
    }
    Record record{hash, std::make_shared<const std::vector<float>>(std::move(*vector))};
    Persist(date, record);
    next.emplace(date, std::move(record));
    ++regenerated;
  }

  if (regenerated > 0) {
    spdlog::info("vector index: regenerated {} of {} vectors", regenerated, entries.size());
  }
  Publish(std::make_shared<const Snapshot>(std::move(next)));
  return regenerated;
}

bool VectorIndex::Upsert(const CalendarDate& date, const std::string& text) {
  if (!available()) {
    return false;
  }
  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto current = CurrentSnapshot();
  const auto hash = core::Sha256Hex(text);
  if (const auto it = current->find(date); it != current->end() && it->second.content_hash == hash) {
    return true;
  }

  auto next = std::make_shared<Snapshot>(*current);
  auto vector = TryEmbed(text);
  if (!vector.has_value()) {
    if (next->erase(date) > 0) {
      Erase(date);
      Publish(std::move(next));
    }
    return false;
  }

  Record record{hash, std::make_shared<const std::vector<float>>(std::move(*vector))};
  Persist(date, record);
  (*next)[date] = std::move(record);
  Publish(std::move(next));
  return true;
}

std::vector<VectorMatch> VectorIndex::Query(const std::string& text, int k) const {
  if (k < 0) {
    throw std::invalid_argument("VectorIndex::Query k must be non-negative");
  }
  if (!available() || k == 0) {
    return {};
  }
  const auto snapshot = CurrentSnapshot();
  if (snapshot->empty()) {
    return {};
  }
  const auto query_vector = TryEmbed(text);
  if (!query_vector.has_value()) {
    return {};
  }

  std::vector<VectorMatch> matches{};
  for (const auto& [date, record] : *snapshot) {
    const float similarity = CosineSimilarity(*query_vector, *record.vector);
    if (similarity > similarity_floor_) {
      matches.push_back(VectorMatch{date, similarity});
    }
  }
  std::sort(matches.begin(), matches.end(), [](const VectorMatch& lhs, const VectorMatch& rhs) {
    if (lhs.similarity != rhs.similarity) {
      return lhs.similarity > rhs.similarity;
    }
    return lhs.date < rhs.date;
  });
  if (matches.size() > static_cast<std::size_t>(k)) {
    matches.resize(static_cast<std::size_t>(k));
  }
  return matches;
}

void VectorIndex::Rebuild(const JournalEntries& entries) {
  if (!available()) {
    return;
  }
  std::lock_guard<std::mutex> writer(writer_mutex_);

  std::vector<CalendarDate> dates{};
  std::vector<std::string> texts{};
  dates.reserve(entries.size());
  texts.reserve(entries.size());
  for (const auto& [date, text] : entries) {
    dates.push_back(date);
    texts.push_back(text);
  }
  auto vectors = EmbedAll(texts);

  Snapshot next{};
  for (std::size_t i = 0; i < dates.size(); ++i) {
    if (!vectors[i].has_value()) {
      continue;
    }
    next.emplace(dates[i],
                 Record{core::Sha256Hex(texts[i]), std::make_shared<const std::vector<float>>(std::move(*vectors[i]))});
  }

  db_.WithTransaction([&]() {
    core::Exec(db_.handle(), "DELETE FROM embeddings;");
    core::Statement insert(db_.handle(),
                           "INSERT INTO embeddings(date, content_hash, dims, vector) VALUES(?1, ?2, ?3, ?4);");
    for (const auto& [date, record] : next) {
      const auto blob = EncodeVectorBlob(*record.vector);
      insert.Reset();
      insert.BindText(1, ToIsoString(date))
          .BindText(2, record.content_hash)
          .BindInt64(3, static_cast<std::int64_t>(record.vector->size()))
          .BindBlob(4, blob);
      insert.Run();
    }
  });

  spdlog::info("vector index: rebuilt {} vectors from {} entries", next.size(), entries.size());
  Publish(std::make_shared<const Snapshot>(std::move(next)));
}

std::size_t VectorIndex::size() const {
  return CurrentSnapshot()->size();
}

bool VectorIndex::Contains(const CalendarDate& date) const {
  return CurrentSnapshot()->count(date) > 0;
}

std::optional<std::string> VectorIndex::ContentHash(const CalendarDate& date) const {
  const auto snapshot = CurrentSnapshot();
  const auto it = snapshot->find(date);
  if (it == snapshot->end()) {
    return std::nullopt;
  }
  return it->second.content_hash;
}

}  // namespace reminorcpp
