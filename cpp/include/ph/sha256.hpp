// include/ph/sha256.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ph {

inline constexpr std::size_t kBlockBytes = 64; // 512-bit block
inline constexpr std::size_t kStateBytes = 32; // 256-bit hash state

// One 512-bit message block, raw bytes in message order.
using Block = std::array<std::uint8_t, kBlockBytes>;

// 256-bit hash state as 8 words (big-endian when serialized).
using HashState = std::array<std::uint32_t, 8>;

// FIPS 180-4 initial hash value H(0).
inline constexpr HashState kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

// Standard padding: 0x80, zeros up to 56 mod 64, then the 64-bit big-endian
// bit length. Throws InputEncodingError if 8*nbytes overflows 64 bits.
std::vector<std::uint8_t> pad_message(const void* data, std::size_t nbytes);

// Splits a padded stream into blocks, order preserved.
// Throws InvariantViolation if the length is not a multiple of 64.
std::vector<Block> split_blocks(const std::vector<std::uint8_t>& padded);

// SHA-256 compression of one block against `state`.
HashState compress(const Block& block, const HashState& state) noexcept;

// Reference SHA-256: pad, split and chain from kInitialState.
HashState sha256(const void* data, std::size_t nbytes);
HashState sha256(const std::string& s);

// Big-endian serialization of a state.
std::array<std::uint8_t, kStateBytes> state_bytes(const HashState& h) noexcept;

// Lowercase, fixed-width hex.
std::string to_hex(const HashState& h);
std::string to_hex(const Block& b);
std::string to_hex(const std::uint8_t* data, std::size_t nbytes);

} // namespace ph
