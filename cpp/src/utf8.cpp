// src/utf8.cpp
#include "ph/ph.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ph {
namespace {

constexpr const char *kReplacement = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at `i` (Unicode table 3-7),
// or 0 if ill-formed; `consumed` is then the maximal subpart to skip.
std::size_t well_formed_length(std::string_view s, std::size_t i,
                               std::size_t &consumed) {
  const auto at = [&](std::size_t k) {
    return static_cast<std::uint8_t>(s[k]);
  };
  const std::uint8_t b0 = at(i);
  consumed = 1;
  if (b0 < 0x80)
    return 1;

  std::size_t len = 0;
  std::uint8_t lo = 0x80, hi = 0xBF; // bounds for the second byte
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 == 0xE0) {
    len = 3;
    lo = 0xA0;
  } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
    len = 3;
  } else if (b0 == 0xED) {
    len = 3;
    hi = 0x9F;
  } else if (b0 == 0xF0) {
    len = 4;
    lo = 0x90;
  } else if (b0 >= 0xF1 && b0 <= 0xF3) {
    len = 4;
  } else if (b0 == 0xF4) {
    len = 4;
    hi = 0x8F;
  } else {
    return 0;
  }

  for (std::size_t k = 1; k < len; ++k) {
    if (i + k >= s.size())
      return 0;
    const std::uint8_t b = at(i + k);
    const std::uint8_t min = (k == 1) ? lo : 0x80;
    const std::uint8_t max = (k == 1) ? hi : 0xBF;
    if (b < min || b > max)
      return 0;
    ++consumed;
  }
  return len;
}

} // namespace

std::string decode_message(std::string_view input, bool strict) {
  std::string out;
  std::size_t i = 0;
  bool clean = true;
  while (i < input.size()) {
    std::size_t consumed = 0;
    const std::size_t len = well_formed_length(input, i, consumed);
    if (len == 0) {
      if (strict)
        throw InputEncodingError("input is not valid UTF-8 (byte offset " +
                                 std::to_string(i) + ")");
      if (clean) {
        out.assign(input.data(), i);
        clean = false;
      }
      out += kReplacement;
      i += consumed;
      continue;
    }
    if (!clean)
      out.append(input.data() + i, len);
    i += len;
  }
  if (clean)
    return std::string(input);
  return out;
}

} // namespace ph
