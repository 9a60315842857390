// src/reduce.cpp
#include "ph/reduce.hpp"
#include "ph/ph.hpp"
#include "ph/sha256.hpp"
#include "parallel.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace ph {

std::vector<HashState> initial_outputs(const std::vector<Block> &blocks,
                                       unsigned threads) {
  std::vector<HashState> out(blocks.size());
  detail::parallel_for(blocks.size(), threads, [&](std::size_t i) {
    out[i] = compress(blocks[i], kInitialState);
  });
  return out;
}

HashState derive_iv(const std::vector<HashState> &H) {
  std::vector<std::uint8_t> buf;
  buf.reserve(H.size() * kStateBytes);
  for (const auto &h : H) {
    const auto bytes = state_bytes(h);
    buf.insert(buf.end(), bytes.begin(), bytes.end());
  }
  return sha256(buf.data(), buf.size());
}

RoundRecord reduce_round(const std::vector<HashState> &H, std::uint32_t round,
                         unsigned threads) {
  const std::size_t k = H.size();
  if (k < 2)
    throw InvariantViolation("reduction round needs at least two inputs, got " +
                             std::to_string(k));

  RoundRecord rec;
  rec.round = round;
  rec.inputs = H;
  rec.iv = derive_iv(H);

  // Left-to-right pairs; an odd tail is not part of any block.
  const std::size_t pairs = k / 2;
  rec.new_blocks.resize(pairs);
  for (std::size_t j = 0; j < pairs; ++j) {
    const auto lo = state_bytes(H[2 * j]);
    const auto hi = state_bytes(H[2 * j + 1]);
    std::memcpy(rec.new_blocks[j].data(), lo.data(), kStateBytes);
    std::memcpy(rec.new_blocks[j].data() + kStateBytes, hi.data(),
                kStateBytes);
  }

  // The IV is read-only for the whole fan-out.
  const HashState &iv = rec.iv;
  rec.outputs.resize(pairs);
  detail::parallel_for(pairs, threads, [&](std::size_t j) {
    rec.outputs[j] = compress(rec.new_blocks[j], iv);
  });
  if (k % 2 != 0)
    rec.outputs.push_back(H[k - 1]);

  if (rec.new_blocks.size() != k / 2 || rec.outputs.size() != (k + 1) / 2)
    throw InvariantViolation("round " + std::to_string(round) +
                             " produced a malformed output list");
  return rec;
}

Reduction reduce_blocks(const std::vector<Block> &blocks, unsigned threads,
                        const RoundRecordCb &cb) {
  if (blocks.empty())
    throw InvariantViolation("reduction over an empty block sequence");

  Reduction out;
  out.initial = initial_outputs(blocks, threads);

  // Rounds are a strict barrier: round r+1 hashes against an IV derived from
  // all of round r's outputs.
  std::vector<HashState> H = out.initial;
  std::uint32_t round = 0;
  while (H.size() > 1) {
    RoundRecord rec = reduce_round(H, ++round, threads);
    H = rec.outputs;
    if (cb)
      cb(rec);
    out.rounds.push_back(std::move(rec));
  }
  out.digest = H.front();
  return out;
}

HashState custom_digest(const void *data, std::size_t nbytes,
                        unsigned threads) {
  return reduce_blocks(split_blocks(pad_message(data, nbytes)), threads)
      .digest;
}

} // namespace ph
