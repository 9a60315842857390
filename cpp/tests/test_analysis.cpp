#include "ph/analysis.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <numeric>
#include <stdexcept>

static ph::AnalysisConfig small_config() {
  ph::AnalysisConfig cfg;
  cfg.samples = 24;
  cfg.buckets = 8;
  cfg.min_length = 120;
  cfg.max_length = 400;
  cfg.seed = 42;
  return cfg;
}

TEST_CASE("Analysis accounts for every sample") {
  auto res = ph::analyze(small_config());
  REQUIRE(res.samples == 24);
  REQUIRE(res.collisions == 0);
  REQUIRE(res.bucket_counts.size() == 8);
  REQUIRE(std::accumulate(res.bucket_counts.begin(), res.bucket_counts.end(),
                          std::uint64_t{0}) == 24);
  REQUIRE(res.avalanche_bits.size() == 24);
  for (auto bits : res.avalanche_bits) {
    REQUIRE(bits > 0);
    REQUIRE(bits <= 256);
  }
  // A one-character change should flip roughly half the digest.
  REQUIRE(res.avalanche_mean > 96.0);
  REQUIRE(res.avalanche_mean < 160.0);
}

TEST_CASE("Same seed, same report") {
  auto a = ph::analyze(small_config());
  auto b = ph::analyze(small_config());
  REQUIRE(a.bucket_counts == b.bucket_counts);
  REQUIRE(a.avalanche_bits == b.avalanche_bits);
}

TEST_CASE("Reject empty or inverted configuration") {
  auto cfg = small_config();
  cfg.samples = 0;
  REQUIRE_THROWS_AS(ph::analyze(cfg), std::invalid_argument);
  cfg = small_config();
  cfg.buckets = 0;
  REQUIRE_THROWS_AS(ph::analyze(cfg), std::invalid_argument);
  cfg = small_config();
  cfg.min_length = 0;
  REQUIRE_THROWS_AS(ph::analyze(cfg), std::invalid_argument);
  cfg = small_config();
  cfg.min_length = 500;
  REQUIRE_THROWS_AS(ph::analyze(cfg), std::invalid_argument);
}
