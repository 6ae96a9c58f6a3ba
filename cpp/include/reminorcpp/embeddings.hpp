#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace reminorcpp {

// Maps text to a dense vector of fixed dimensionality. Implementations may throw; callers treat a
// throwing provider as temporarily unavailable.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
};

// Feature-hashing bag-of-words embedder. Deterministic and dependency free; good enough for
// offline journals and for tests. Results are memoized up to `memoization_capacity` texts.
class HashingEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  [[nodiscard]] std::vector<float> Compute(const std::string& text) const;

  int dimensions_ = 0;
  std::size_t memoization_capacity_ = 0;
  std::unordered_map<std::string, std::vector<float>> memoized_{};
  std::deque<std::string> memoization_order_{};
  mutable std::mutex mutex_{};
};

}  // namespace reminorcpp
