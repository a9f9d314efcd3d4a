#include "hashtok/blake3.hpp"

#include <algorithm>
#include <cstring>

// BLAKE3 default hash mode, portable C++ (no SIMD)

namespace {

constexpr size_t OUT_LEN = 32;
constexpr size_t BLOCK_LEN = 64;
constexpr size_t CHUNK_LEN = 1024;
constexpr size_t MAX_DEPTH = 54;

constexpr uint32_t IV[8] = {
    0x6A09E667, 0xBB67AE85, 0x3C6EF372, 0xA54FF53A,
    0x510E527F, 0x9B05688C, 0x1F83D9AB, 0x5BE0CD19
};

constexpr uint8_t MSG_PERMUTATION[16] = {
    2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8
};

enum Flags : uint32_t {
    CHUNK_START = 1 << 0,
    CHUNK_END = 1 << 1,
    PARENT = 1 << 2,
    ROOT = 1 << 3,
};

inline uint32_t rotr32(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store32_le(uint8_t* p, uint32_t x) {
    p[0] = static_cast<uint8_t>(x);
    p[1] = static_cast<uint8_t>(x >> 8);
    p[2] = static_cast<uint8_t>(x >> 16);
    p[3] = static_cast<uint8_t>(x >> 24);
}

inline void g(uint32_t* s, size_t a, size_t b, size_t c, size_t d, uint32_t mx, uint32_t my) {
    s[a] = s[a] + s[b] + mx;
    s[d] = rotr32(s[d] ^ s[a], 16);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 12);
    s[a] = s[a] + s[b] + my;
    s[d] = rotr32(s[d] ^ s[a], 8);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 7);
}

void round_fn(uint32_t* s, const uint32_t* m) {
    // Columns
    g(s, 0, 4, 8, 12, m[0], m[1]);
    g(s, 1, 5, 9, 13, m[2], m[3]);
    g(s, 2, 6, 10, 14, m[4], m[5]);
    g(s, 3, 7, 11, 15, m[6], m[7]);
    // Diagonals
    g(s, 0, 5, 10, 15, m[8], m[9]);
    g(s, 1, 6, 11, 12, m[10], m[11]);
    g(s, 2, 7, 8, 13, m[12], m[13]);
    g(s, 3, 4, 9, 14, m[14], m[15]);
}

void permute(uint32_t* m) {
    uint32_t permuted[16];
    for (size_t i = 0; i < 16; ++i) permuted[i] = m[MSG_PERMUTATION[i]];
    std::memcpy(m, permuted, sizeof(permuted));
}

void compress(const uint32_t cv[8], const uint32_t block_words[16], uint64_t counter,
              uint32_t block_len, uint32_t flags, uint32_t out[16]) {
    uint32_t state[16] = {
        cv[0], cv[1], cv[2], cv[3],
        cv[4], cv[5], cv[6], cv[7],
        IV[0], IV[1], IV[2], IV[3],
        static_cast<uint32_t>(counter),
        static_cast<uint32_t>(counter >> 32),
        block_len,
        flags
    };
    uint32_t m[16];
    std::memcpy(m, block_words, sizeof(m));

    for (int r = 0; r < 7; ++r) {
        round_fn(state, m);
        if (r < 6) permute(m);
    }

    for (size_t i = 0; i < 8; ++i) {
        out[i] = state[i] ^ state[i + 8];
        out[i + 8] = state[i + 8] ^ cv[i];
    }
}

void words_from_block(const uint8_t block[BLOCK_LEN], uint32_t words[16]) {
    for (size_t i = 0; i < 16; ++i) words[i] = load32_le(block + 4 * i);
}

// Inputs of one compression whose chaining value or root bytes are still pending
struct Output {
    uint32_t input_cv[8];
    uint32_t block_words[16];
    uint64_t counter;
    uint32_t block_len;
    uint32_t flags;

    void chaining_value(uint32_t cv[8]) const {
        uint32_t out[16];
        compress(input_cv, block_words, counter, block_len, flags, out);
        std::memcpy(cv, out, 8 * sizeof(uint32_t));
    }

    void root_bytes(uint8_t out_bytes[OUT_LEN]) const {
        uint32_t out[16];
        compress(input_cv, block_words, 0, block_len, flags | ROOT, out);
        for (size_t i = 0; i < 8; ++i) store32_le(out_bytes + 4 * i, out[i]);
    }
};

Output parent_output(const uint32_t left[8], const uint32_t right[8]) {
    Output o{};
    std::memcpy(o.input_cv, IV, sizeof(IV));
    std::memcpy(o.block_words, left, 8 * sizeof(uint32_t));
    std::memcpy(o.block_words + 8, right, 8 * sizeof(uint32_t));
    o.counter = 0;
    o.block_len = BLOCK_LEN;
    o.flags = PARENT;
    return o;
}

struct ChunkState {
    uint32_t cv[8];
    uint64_t chunk_counter = 0;
    uint8_t block[BLOCK_LEN] = {};
    size_t block_len = 0;
    size_t blocks_compressed = 0;

    explicit ChunkState(uint64_t counter) : chunk_counter(counter) {
        std::memcpy(cv, IV, sizeof(IV));
    }

    size_t len() const { return BLOCK_LEN * blocks_compressed + block_len; }

    uint32_t start_flag() const { return blocks_compressed == 0 ? CHUNK_START : 0; }

    void update(const uint8_t* input, size_t input_len) {
        while (input_len > 0) {
            if (block_len == BLOCK_LEN) {
                uint32_t words[16];
                words_from_block(block, words);
                uint32_t out[16];
                compress(cv, words, chunk_counter, BLOCK_LEN, start_flag(), out);
                std::memcpy(cv, out, sizeof(cv));
                ++blocks_compressed;
                std::memset(block, 0, sizeof(block));
                block_len = 0;
            }
            size_t take = std::min(BLOCK_LEN - block_len, input_len);
            std::memcpy(block + block_len, input, take);
            block_len += take;
            input += take;
            input_len -= take;
        }
    }

    Output output() const {
        Output o{};
        std::memcpy(o.input_cv, cv, sizeof(cv));
        words_from_block(block, o.block_words);
        o.counter = chunk_counter;
        o.block_len = static_cast<uint32_t>(block_len);
        o.flags = start_flag() | CHUNK_END;
        return o;
    }
};

class Hasher {
public:
    void update(const uint8_t* input, size_t input_len) {
        while (input_len > 0) {
            if (chunk_.len() == CHUNK_LEN) {
                uint32_t chunk_cv[8];
                chunk_.output().chaining_value(chunk_cv);
                uint64_t total_chunks = chunk_.chunk_counter + 1;
                add_chunk_chaining_value(chunk_cv, total_chunks);
                chunk_ = ChunkState(total_chunks);
            }
            size_t take = std::min(CHUNK_LEN - chunk_.len(), input_len);
            chunk_.update(input, take);
            input += take;
            input_len -= take;
        }
    }

    void finalize(uint8_t out[OUT_LEN]) const {
        Output output = chunk_.output();
        size_t remaining = stack_len_;
        while (remaining > 0) {
            --remaining;
            uint32_t right[8];
            output.chaining_value(right);
            output = parent_output(cv_stack_[remaining], right);
        }
        output.root_bytes(out);
    }

private:
    // Merges completed subtrees; the number of trailing zero bits of
    // total_chunks is the number of merges owed
    void add_chunk_chaining_value(uint32_t new_cv[8], uint64_t total_chunks) {
        while ((total_chunks & 1) == 0) {
            --stack_len_;
            parent_output(cv_stack_[stack_len_], new_cv).chaining_value(new_cv);
            total_chunks >>= 1;
        }
        std::memcpy(cv_stack_[stack_len_], new_cv, 8 * sizeof(uint32_t));
        ++stack_len_;
    }

    ChunkState chunk_{0};
    uint32_t cv_stack_[MAX_DEPTH][8] = {};
    size_t stack_len_ = 0;
};

} // anonymous namespace

namespace hashtok {

Blake3Hash Blake3Hasher::hash(std::span<const uint8_t> data) noexcept {
    Hasher hasher;
    hasher.update(data.data(), data.size());

    Blake3Hash result;
    hasher.finalize(result.bytes.data());
    return result;
}

Blake3Hash Blake3Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

} // namespace hashtok
