// src/hex.cpp
#include "ph/sha256.hpp"

#include <cstdint>
#include <string>

namespace ph {

std::array<std::uint8_t, kStateBytes> state_bytes(const HashState &h) noexcept {
  std::array<std::uint8_t, kStateBytes> out{};
  for (std::size_t i = 0; i < h.size(); ++i) {
    out[4 * i] = static_cast<std::uint8_t>(h[i] >> 24);
    out[4 * i + 1] = static_cast<std::uint8_t>(h[i] >> 16);
    out[4 * i + 2] = static_cast<std::uint8_t>(h[i] >> 8);
    out[4 * i + 3] = static_cast<std::uint8_t>(h[i]);
  }
  return out;
}

std::string to_hex(const std::uint8_t *data, std::size_t nbytes) {
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(nbytes * 2);
  for (std::size_t i = 0; i < nbytes; ++i) {
    out[2 * i] = hex[(data[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[data[i] & 0xF];
  }
  return out;
}

std::string to_hex(const HashState &h) {
  const auto bytes = state_bytes(h);
  return to_hex(bytes.data(), bytes.size());
}

std::string to_hex(const Block &b) { return to_hex(b.data(), b.size()); }

} // namespace ph
