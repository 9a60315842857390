// src/sha256.cpp
#include "ph/sha256.hpp"
#include "ph/ph.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ph {
namespace {

inline constexpr std::uint32_t rotr(std::uint32_t x, int n) {
  return (x >> n) | (x << (32 - n));
}
inline std::uint32_t load_be32(const std::uint8_t *p) {
  return (std::uint32_t)p[0] << 24 | (std::uint32_t)p[1] << 16 |
         (std::uint32_t)p[2] << 8 | (std::uint32_t)p[3];
}

constexpr std::uint32_t K[64] = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
    0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
    0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
    0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
    0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
    0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
    0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
    0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
    0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
    0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

// Sigma/sigma and Ch/Maj, FIPS 180-4 section 4.1.2.
inline std::uint32_t big_sigma0(std::uint32_t x) {
  return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22);
}
inline std::uint32_t big_sigma1(std::uint32_t x) {
  return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25);
}
inline std::uint32_t small_sigma0(std::uint32_t x) {
  return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3);
}
inline std::uint32_t small_sigma1(std::uint32_t x) {
  return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10);
}
inline std::uint32_t ch(std::uint32_t e, std::uint32_t f, std::uint32_t g) {
  return (e & f) ^ (~e & g);
}
inline std::uint32_t maj(std::uint32_t a, std::uint32_t b, std::uint32_t c) {
  return (a & b) ^ (a & c) ^ (b & c);
}

HashState compress_raw(const std::uint8_t *blk, const HashState &H) noexcept {
  std::uint32_t w[64];
  for (int i = 0; i < 16; ++i)
    w[i] = load_be32(blk + 4 * i);
  for (int i = 16; i < 64; ++i)
    w[i] = w[i - 16] + small_sigma0(w[i - 15]) + w[i - 7] +
           small_sigma1(w[i - 2]);

  std::uint32_t a = H[0], b = H[1], c = H[2], d = H[3], e = H[4], f = H[5],
                g = H[6], h = H[7];
  for (int i = 0; i < 64; ++i) {
    std::uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + K[i] + w[i];
    std::uint32_t t2 = big_sigma0(a) + maj(a, b, c);
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }
  return HashState{H[0] + a, H[1] + b, H[2] + c, H[3] + d,
                   H[4] + e, H[5] + f, H[6] + g, H[7] + h};
}

} // namespace

HashState compress(const Block &block, const HashState &state) noexcept {
  return compress_raw(block.data(), state);
}

HashState sha256(const void *data, std::size_t nbytes) {
  const std::vector<std::uint8_t> padded = pad_message(data, nbytes);
  if (padded.size() % kBlockBytes != 0)
    throw InvariantViolation("padded length is not a multiple of 64 bytes");

  // Chained fold; blocks are read in place rather than copied out.
  HashState H = kInitialState;
  for (std::size_t off = 0; off < padded.size(); off += kBlockBytes)
    H = compress_raw(padded.data() + off, H);
  return H;
}

HashState sha256(const std::string &s) { return sha256(s.data(), s.size()); }

} // namespace ph
