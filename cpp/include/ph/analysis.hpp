// include/ph/analysis.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ph {

// Collision / uniformity / avalanche sweep over the custom digest.
struct AnalysisConfig {
  std::uint32_t samples = 1000;
  std::uint32_t buckets = 64;
  std::size_t min_length = 120;   // random message length range, inclusive
  std::size_t max_length = 1300;
  std::uint64_t seed = 0;         // mt19937_64 seed; same seed, same report
  unsigned threads = 1;
};

struct AnalysisResult {
  std::uint32_t samples = 0;
  std::uint32_t collisions = 0;                // repeated digests
  std::vector<std::uint64_t> bucket_counts;    // digest mod buckets
  std::vector<std::uint32_t> avalanche_bits;   // per sample, 0..256
  double avalanche_mean = 0.0;
  std::uint64_t ns_elapsed = 0;
};

// Throws std::invalid_argument on an empty or inverted configuration.
AnalysisResult analyze(const AnalysisConfig& cfg);

} // namespace ph
