#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace hashtok {

/**
 * 256-bit BLAKE3 digest
 */
struct Blake3Hash {
    std::array<uint8_t, 32> bytes{};

    bool operator==(const Blake3Hash& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Blake3Hash& other) const noexcept { return !(*this == other); }

    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    // Digest read as a big-endian unsigned integer, reduced modulo `modulus`.
    // `modulus` must be non-zero and below 2^56.
    uint64_t mod(uint64_t modulus) const noexcept {
        uint64_t r = 0;
        for (uint8_t b : bytes) {
            r = ((r << 8) | b) % modulus;
        }
        return r;
    }

    // First 8 bytes, little-endian
    uint64_t truncated_64() const noexcept {
        uint64_t result = 0;
        for (int i = 7; i >= 0; --i) {
            result = (result << 8) | bytes[static_cast<size_t>(i)];
        }
        return result;
    }
};

/**
 * BLAKE3 hashing of token bytes.
 *
 * Portable scalar implementation of the default (unkeyed) hash mode with a
 * 32-byte output. Thread-safe: no state is shared between calls.
 */
class Blake3Hasher {
public:
    static Blake3Hash hash(std::span<const uint8_t> data) noexcept;
    static Blake3Hash hash(std::string_view str) noexcept;
};

} // namespace hashtok
