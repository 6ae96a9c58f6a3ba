#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace reminorcpp::core {

// Incremental SHA-256 used for content hashes (embedding staleness, analysis cache keys).
class Sha256 {
 public:
  using Digest = std::array<std::uint8_t, 32>;

  Sha256();

  Sha256& Update(std::span<const std::uint8_t> bytes);
  Sha256& Update(std::string_view text);
  [[nodiscard]] Digest Finish();

 private:
  void Compress(const std::uint8_t* block);

  std::array<std::uint32_t, 8> h_{};
  std::array<std::uint8_t, 64> block_{};
  std::size_t block_used_ = 0;
  std::uint64_t total_bytes_ = 0;
  bool finished_ = false;
};

[[nodiscard]] std::string ToHex(std::span<const std::uint8_t> bytes);

// Lower-case hex digest of `text`.
[[nodiscard]] std::string Sha256Hex(std::string_view text);

}  // namespace reminorcpp::core
