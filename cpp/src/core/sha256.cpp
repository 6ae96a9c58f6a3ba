#include "sha256.hpp"

#include <algorithm>
#include <stdexcept>

namespace reminorcpp::core {
namespace {

constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98U, 0x71374491U, 0xb5c0fbcfU, 0xe9b5dba5U, 0x3956c25bU, 0x59f111f1U, 0x923f82a4U, 0xab1c5ed5U,
    0xd807aa98U, 0x12835b01U, 0x243185beU, 0x550c7dc3U, 0x72be5d74U, 0x80deb1feU, 0x9bdc06a7U, 0xc19bf174U,
    0xe49b69c1U, 0xefbe4786U, 0x0fc19dc6U, 0x240ca1ccU, 0x2de92c6fU, 0x4a7484aaU, 0x5cb0a9dcU, 0x76f988daU,
    0x983e5152U, 0xa831c66dU, 0xb00327c8U, 0xbf597fc7U, 0xc6e00bf3U, 0xd5a79147U, 0x06ca6351U, 0x14292967U,
    0x27b70a85U, 0x2e1b2138U, 0x4d2c6dfcU, 0x53380d13U, 0x650a7354U, 0x766a0abbU, 0x81c2c92eU, 0x92722c85U,
    0xa2bfe8a1U, 0xa81a664bU, 0xc24b8b70U, 0xc76c51a3U, 0xd192e819U, 0xd6990624U, 0xf40e3585U, 0x106aa070U,
    0x19a4c116U, 0x1e376c08U, 0x2748774cU, 0x34b0bcb5U, 0x391c0cb3U, 0x4ed8aa4aU, 0x5b9cca4fU, 0x682e6ff3U,
    0x748f82eeU, 0x78a5636fU, 0x84c87814U, 0x8cc70208U, 0x90befffaU, 0xa4506cebU, 0xbef9a3f7U, 0xc67178f2U,
};

constexpr std::uint32_t Rotr(std::uint32_t x, unsigned n) {
  return (x >> n) | (x << (32U - n));
}

std::uint32_t LoadBE32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U) |
         (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256()
    : h_({0x6a09e667U, 0xbb67ae85U, 0x3c6ef372U, 0xa54ff53aU, 0x510e527fU, 0x9b05688cU, 0x1f83d9abU,
          0x5be0cd19U}) {}

Sha256& Sha256::Update(std::span<const std::uint8_t> bytes) {
  if (finished_) {
    throw std::logic_error("Sha256::Update after Finish");
  }
  total_bytes_ += bytes.size();
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const std::size_t take = std::min(block_.size() - block_used_, bytes.size() - offset);
    std::copy_n(bytes.data() + offset, take, block_.data() + block_used_);
    block_used_ += take;
    offset += take;
    if (block_used_ == block_.size()) {
      Compress(block_.data());
      block_used_ = 0;
    }
  }
  return *this;
}

Sha256& Sha256::Update(std::string_view text) {
  return Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Sha256::Digest Sha256::Finish() {
  if (finished_) {
    throw std::logic_error("Sha256::Finish called twice");
  }
  const std::uint64_t bit_count = total_bytes_ * 8U;
  block_[block_used_++] = 0x80U;
  if (block_used_ > 56) {
    std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_used_), block_.end(), 0U);
    Compress(block_.data());
    block_used_ = 0;
  }
  std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_used_), block_.begin() + 56, 0U);
  for (int i = 0; i < 8; ++i) {
    block_[56 + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(bit_count >> (56 - 8 * i));
  }
  Compress(block_.data());
  finished_ = true;

  Digest digest{};
  for (std::size_t i = 0; i < h_.size(); ++i) {
    digest[i * 4 + 0] = static_cast<std::uint8_t>(h_[i] >> 24U);
    digest[i * 4 + 1] = static_cast<std::uint8_t>(h_[i] >> 16U);
    digest[i * 4 + 2] = static_cast<std::uint8_t>(h_[i] >> 8U);
    digest[i * 4 + 3] = static_cast<std::uint8_t>(h_[i]);
  }
  return digest;
}

void Sha256::Compress(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (std::size_t i = 0; i < 16; ++i) {
    w[i] = LoadBE32(block + i * 4);
  }
  for (std::size_t i = 16; i < 64; ++i) {
    const std::uint32_t s0 = Rotr(w[i - 15], 7) ^ Rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
    const std::uint32_t s1 = Rotr(w[i - 2], 17) ^ Rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  auto v = h_;
  for (std::size_t i = 0; i < 64; ++i) {
    const std::uint32_t big_s1 = Rotr(v[4], 6) ^ Rotr(v[4], 11) ^ Rotr(v[4], 25);
    const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t t1 = v[7] + big_s1 + choose + kK[i] + w[i];
    const std::uint32_t big_s0 = Rotr(v[0], 2) ^ Rotr(v[0], 13) ^ Rotr(v[0], 22);
    const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t2 = big_s0 + majority;
    std::rotate(v.rbegin(), v.rbegin() + 1, v.rend());
    v[4] += t1;
    v[0] = t1 + t2;
  }
  for (std::size_t i = 0; i < h_.size(); ++i) {
    h_[i] += v[i];
  }
}

std::string ToHex(std::span<const std::uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kDigits[byte >> 4U]);
    out.push_back(kDigits[byte & 0x0FU]);
  }
  return out;
}

std::string Sha256Hex(std::string_view text) {
  Sha256 hasher{};
  const auto digest = hasher.Update(text).Finish();
  return ToHex(digest);
}

}  // namespace reminorcpp::core
