// =============================================================================
// Blake3 Hash Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hashtok/blake3.hpp"
#include <string>
#include <vector>

using namespace hashtok;

class Blake3Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Reference digests from the BLAKE3 paper
TEST_F(Blake3Test, EmptyInputKnownAnswer) {
    auto hash = Blake3Hasher::hash(std::string_view(""));
    EXPECT_EQ(hash.to_hex(), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST_F(Blake3Test, AbcKnownAnswer) {
    auto hash = Blake3Hasher::hash(std::string_view("abc"));
    EXPECT_EQ(hash.to_hex(), "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST_F(Blake3Test, SpanAndStringAgree) {
    std::vector<uint8_t> data = {0x48, 0x65, 0x6c, 0x6c, 0x6f};  // "Hello"

    auto from_span = Blake3Hasher::hash(std::span<const uint8_t>(data));
    auto from_string = Blake3Hasher::hash(std::string_view("Hello"));

    EXPECT_EQ(from_span, from_string);
}

TEST_F(Blake3Test, DifferentInputsDifferentHashes) {
    auto hash1 = Blake3Hasher::hash(std::string_view("Hello"));
    auto hash2 = Blake3Hasher::hash(std::string_view("World"));

    EXPECT_NE(hash1, hash2);
}

// One bit of difference flips roughly half of the output bits
TEST_F(Blake3Test, AvalancheEffect) {
    std::vector<uint8_t> data1 = {0x00, 0x00, 0x00, 0x00};
    std::vector<uint8_t> data2 = {0x00, 0x00, 0x00, 0x01};

    auto hash1 = Blake3Hasher::hash(std::span<const uint8_t>(data1));
    auto hash2 = Blake3Hasher::hash(std::span<const uint8_t>(data2));

    int diff_bits = 0;
    for (size_t i = 0; i < 32; ++i) {
        diff_bits += __builtin_popcount(hash1.bytes[i] ^ hash2.bytes[i]);
    }
    EXPECT_GT(diff_bits, 64);
    EXPECT_LT(diff_bits, 192);
}

// Inputs spanning several 1024-byte chunks go through the chaining-value tree
TEST_F(Blake3Test, MultiChunkInput) {
    std::vector<uint8_t> data(3000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i % 251);
    }

    auto full = Blake3Hasher::hash(std::span<const uint8_t>(data));
    auto again = Blake3Hasher::hash(std::span<const uint8_t>(data));
    auto one_chunk = Blake3Hasher::hash(std::span<const uint8_t>(data.data(), 1024));
    auto chunk_plus_one = Blake3Hasher::hash(std::span<const uint8_t>(data.data(), 1025));

    EXPECT_EQ(full, again);
    EXPECT_NE(full, one_chunk);
    EXPECT_NE(one_chunk, chunk_plus_one);
}

TEST_F(Blake3Test, ModMatchesBigEndianReading) {
    auto hash = Blake3Hasher::hash(std::string_view("abc"));

    // 256 divides 2^8k, so the remainder is the last byte
    EXPECT_EQ(hash.mod(256), hash.bytes[31]);
    // 2^16 keeps the last two bytes, most significant first
    EXPECT_EQ(hash.mod(65536), (static_cast<uint64_t>(hash.bytes[30]) << 8) | hash.bytes[31]);
    EXPECT_EQ(hash.mod(1), 0u);
}

TEST_F(Blake3Test, Truncated64IsLittleEndianPrefix) {
    auto hash = Blake3Hasher::hash(std::string_view("abc"));

    uint64_t expected = 0;
    for (int i = 7; i >= 0; --i) {
        expected = (expected << 8) | hash.bytes[static_cast<size_t>(i)];
    }
    EXPECT_EQ(hash.truncated_64(), expected);
    EXPECT_EQ(hash.truncated_64() & 0xFF, hash.bytes[0]);
}
