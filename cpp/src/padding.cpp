// src/padding.cpp
#include "ph/ph.hpp"
#include "ph/sha256.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

namespace ph {

std::vector<std::uint8_t> pad_message(const void *data, std::size_t nbytes) {
  if (static_cast<std::uint64_t>(nbytes) >
      std::numeric_limits<std::uint64_t>::max() / 8)
    throw InputEncodingError("message too long for a 64-bit bit-length field");
  const std::uint64_t bits = static_cast<std::uint64_t>(nbytes) * 8;

  // 0x80 plus the 8-byte length must fit; round up to the next block.
  const std::size_t total = (nbytes + 1 + 8 + kBlockBytes - 1) / kBlockBytes *
                            kBlockBytes;
  std::vector<std::uint8_t> out(total, 0);
  if (nbytes)
    std::memcpy(out.data(), data, nbytes);
  out[nbytes] = 0x80;
  for (int i = 0; i < 8; ++i)
    out[total - 1 - i] = static_cast<std::uint8_t>(bits >> (8 * i));
  return out;
}

std::vector<Block> split_blocks(const std::vector<std::uint8_t> &padded) {
  if (padded.empty() || padded.size() % kBlockBytes != 0)
    throw InvariantViolation("padded stream is not a whole number of blocks");

  std::vector<Block> blocks(padded.size() / kBlockBytes);
  for (std::size_t i = 0; i < blocks.size(); ++i)
    std::memcpy(blocks[i].data(), padded.data() + i * kBlockBytes,
                kBlockBytes);
  return blocks;
}

} // namespace ph
