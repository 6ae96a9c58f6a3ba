#include "reminorcpp/embeddings.hpp"

#include "../core/text_utils.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace reminorcpp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t Fnv1a(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw std::invalid_argument("HashingEmbedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

std::vector<float> HashingEmbedder::Compute(const std::string& text) const {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);
  for (const auto& token : core::SplitWords(core::ToLowerAscii(text), true)) {
    if (core::IsStopword(token.text)) {
      continue;
    }
    const auto hash = Fnv1a(token.text);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }
  NormalizeL2(embedding);
  return embedding;
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_.find(text);
    if (cached != memoized_.end()) {
      return cached->second;
    }
  }

  auto embedding = Compute(text);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_.find(text) == memoized_.end()) {
      while (memoized_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_.emplace(text, embedding);
    }
  }
  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_.size();
}

}  // namespace reminorcpp
