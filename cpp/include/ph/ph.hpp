// include/ph/ph.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ph {

// Bump when the response contract changes.
inline constexpr const char* PH_VERSION = "0.1.0";

// Input could not be taken as a message (bad UTF-8 in strict mode, or too
// long for the 64-bit length field).
class InputEncodingError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Engine defect: some stage produced data that breaks a structural rule.
class InvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

struct HashConfig {
  unsigned threads = 0;     // 0 = hardware concurrency, 1 = calling thread only
  bool strict_utf8 = true;  // false: accept raw bytes, echo with U+FFFD
};

// Hex snapshot of one reduction round.
struct Round {
  std::uint32_t round = 0;
  std::vector<std::string> input_hash_outputs;
  std::string computed_new_iv;
  std::vector<std::string> new_blocks;
  std::vector<std::string> output_hash_outputs;
};

struct Trace {
  std::string original_message;
  std::string padded;
  std::vector<std::string> blocks;
  std::vector<std::string> initial_hash_outputs;
  std::vector<Round> rounds;
  std::string final_digest;
};

struct HashResponse {
  std::string final_digest;
  std::string normal_hash;
  Trace trace;
};

// Called once per recorded round, in order, on the calling thread.
using RoundCb = std::function<void(const Round&)>;

// Single entrypoint: reference SHA-256 plus the traced reduction digest.
// Throws InputEncodingError for rejected input, InvariantViolation on an
// engine defect.
HashResponse compute(std::string_view input, const HashConfig& cfg = {},
                     RoundCb cb = {});

// Validates `input` as UTF-8. Returns it unchanged when valid; otherwise
// throws InputEncodingError if `strict`, else returns a copy with each
// maximal ill-formed subsequence replaced by U+FFFD.
std::string decode_message(std::string_view input, bool strict);

} // namespace ph
