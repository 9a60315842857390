// include/ph/reduce.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "sha256.hpp"

namespace ph {

// One reduction step in binary form.
struct RoundRecord {
  std::uint32_t round = 0;              // 1-based
  std::vector<HashState> inputs;        // H consumed by this round
  HashState iv{};                       // computed new IV, shared by all pairs
  std::vector<Block> new_blocks;        // floor(k/2) paired blocks
  std::vector<HashState> outputs;       // ceil(k/2): hashed pairs + odd carry
};

struct Reduction {
  std::vector<HashState> initial;       // one per message block
  std::vector<RoundRecord> rounds;
  HashState digest{};
};

using RoundRecordCb = std::function<void(const RoundRecord&)>;

// Step 0: every block compressed against kInitialState, unchained.
std::vector<HashState> initial_outputs(const std::vector<Block>& blocks,
                                       unsigned threads);

// SHA-256 over the big-endian concatenation of all of `H`.
HashState derive_iv(const std::vector<HashState>& H);

// One round over `H` (size >= 2). Throws InvariantViolation otherwise.
RoundRecord reduce_round(const std::vector<HashState>& H, std::uint32_t round,
                         unsigned threads);

// Full custom path over already split blocks. `cb` sees each round as soon
// as it is complete.
Reduction reduce_blocks(const std::vector<Block>& blocks, unsigned threads,
                        const RoundRecordCb& cb = {});

// Custom digest only (no trace kept).
HashState custom_digest(const void* data, std::size_t nbytes,
                        unsigned threads = 1);

} // namespace ph
