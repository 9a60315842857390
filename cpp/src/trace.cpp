// src/trace.cpp
#include "ph/ph.hpp"
#include "ph/reduce.hpp"
#include "ph/sha256.hpp"
#include "parallel.hpp"

#include <future>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ph {
namespace {

template <typename T>
std::vector<std::string> hex_all(const std::vector<T> &xs) {
  std::vector<std::string> out;
  out.reserve(xs.size());
  for (const auto &x : xs)
    out.push_back(to_hex(x));
  return out;
}

Round snapshot(const RoundRecord &rec) {
  Round r;
  r.round = rec.round;
  r.input_hash_outputs = hex_all(rec.inputs);
  r.computed_new_iv = to_hex(rec.iv);
  r.new_blocks = hex_all(rec.new_blocks);
  r.output_hash_outputs = hex_all(rec.outputs);
  return r;
}

void check_trace(const Trace &t, const Reduction &red) {
  if (t.blocks.size() != t.initial_hash_outputs.size())
    throw InvariantViolation("initial hash outputs do not match block count");
  const std::vector<std::string> &last = t.rounds.empty()
                                             ? t.initial_hash_outputs
                                             : t.rounds.back().output_hash_outputs;
  if (last.size() != 1)
    throw InvariantViolation("reduction did not end with a single output");
  if (last.front() != to_hex(red.digest))
    throw InvariantViolation("final digest differs from last reduction output");
}

} // namespace

HashResponse compute(std::string_view input, const HashConfig &cfg,
                     RoundCb cb) {
  HashResponse out;
  Trace &trace = out.trace;
  trace.original_message = decode_message(input, cfg.strict_utf8);

  const std::vector<std::uint8_t> padded =
      pad_message(input.data(), input.size());
  const std::vector<Block> blocks = split_blocks(padded);
  trace.padded = to_hex(padded.data(), padded.size());
  trace.blocks = hex_all(blocks);

  // Reference path shares nothing with the reduction; overlap them unless
  // the caller asked for a single thread.
  const unsigned threads = detail::resolve_threads(cfg.threads);
  std::future<HashState> reference;
  HashState normal{};
  if (threads > 1)
    reference = std::async(std::launch::async, [input]() {
      return sha256(input.data(), input.size());
    });
  else
    normal = sha256(input.data(), input.size());

  // Rounds are appended as finished records; nothing already in the trace is
  // touched again.
  const Reduction red =
      reduce_blocks(blocks, threads, [&](const RoundRecord &rec) {
        trace.rounds.push_back(snapshot(rec));
        if (cb)
          cb(trace.rounds.back());
      });
  trace.initial_hash_outputs = hex_all(red.initial);
  trace.final_digest = to_hex(red.digest);
  check_trace(trace, red);

  if (reference.valid())
    normal = reference.get();
  out.normal_hash = to_hex(normal);
  out.final_digest = trace.final_digest;
  return out;
}

} // namespace ph
