// src/analysis.cpp
#include "ph/analysis.hpp"
#include "ph/ph.hpp"
#include "ph/reduce.hpp"
#include "ph/sha256.hpp"

#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace ph {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

std::string random_message(std::mt19937_64 &rng, std::size_t min_len,
                           std::size_t max_len) {
  std::uniform_int_distribution<std::size_t> len(min_len, max_len);
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
  std::string s(len(rng), '\0');
  for (auto &c : s)
    c = kAlphabet[pick(rng)];
  return s;
}

// Loads a 64-char digest into `x` as an unsigned 256-bit integer.
void load_digest(mpz_t x, const std::string &hex) {
  if (mpz_set_str(x, hex.c_str(), 16) != 0)
    throw InvariantViolation("digest is not a hex string: " + hex);
}

} // namespace

AnalysisResult analyze(const AnalysisConfig &cfg) {
  if (cfg.samples == 0)
    throw std::invalid_argument("samples must be >= 1");
  if (cfg.buckets == 0)
    throw std::invalid_argument("buckets must be >= 1");
  if (cfg.min_length == 0 || cfg.min_length > cfg.max_length)
    throw std::invalid_argument("need 1 <= min_length <= max_length");

  AnalysisResult out;
  out.samples = cfg.samples;
  out.bucket_counts.assign(cfg.buckets, 0);
  out.avalanche_bits.reserve(cfg.samples);

  auto t0 = std::chrono::steady_clock::now();

  std::mt19937_64 rng(cfg.seed);
  std::unordered_set<std::string> seen;
  seen.reserve(cfg.samples);

  mpz_t base, flipped;
  mpz_init2(base, 256);
  mpz_init2(flipped, 256);

  std::uint64_t bit_sum = 0;
  try {
    for (std::uint32_t i = 0; i < cfg.samples; ++i) {
      std::string msg = random_message(rng, cfg.min_length, cfg.max_length);
      const std::string digest =
          to_hex(custom_digest(msg.data(), msg.size(), cfg.threads));

      if (!seen.insert(digest).second)
        ++out.collisions;

      load_digest(base, digest);
      ++out.bucket_counts[mpz_fdiv_ui(base, cfg.buckets)];

      // Single-character change in the first byte, kept 7-bit.
      msg[0] = static_cast<char>((static_cast<unsigned char>(msg[0]) + 1) % 128);
      load_digest(flipped,
                  to_hex(custom_digest(msg.data(), msg.size(), cfg.threads)));
      const auto bits = static_cast<std::uint32_t>(mpz_hamdist(base, flipped));
      out.avalanche_bits.push_back(bits);
      bit_sum += bits;
    }
  } catch (...) {
    mpz_clear(base);
    mpz_clear(flipped);
    throw;
  }

  mpz_clear(base);
  mpz_clear(flipped);

  out.avalanche_mean =
      static_cast<double>(bit_sum) / static_cast<double>(cfg.samples);
  auto t1 = std::chrono::steady_clock::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  return out;
}

} // namespace ph
