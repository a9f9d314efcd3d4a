#pragma once

#include "hashtok/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

namespace hashtok {

/**
 * Id range of an embedding table.
 *
 * Hashed tokens land in [padding_idx + SpecialTokens::count, num_embeddings);
 * everything below is reserved for special tokens.
 */
class VocabularyBounds {
public:
    // Keeps the bit arithmetic of both quantizers inside 64-bit integers
    static constexpr TokenId kMaxNumEmbeddings = TokenId(1) << 40;

    // Throws ConfigurationError when the hashed range would be empty
    explicit VocabularyBounds(TokenId num_embeddings, TokenId padding_idx = 0);

    TokenId num_embeddings() const noexcept { return num_embeddings_; }
    TokenId padding_idx() const noexcept { return padding_idx_; }
    TokenId first_free_id() const noexcept { return SpecialTokens::first_free_id(padding_idx_); }

    // raw mod num_embeddings, lifted out of the reserved range
    TokenId reduce(uint64_t raw) const noexcept {
        const auto id = static_cast<TokenId>(raw % static_cast<uint64_t>(num_embeddings_));
        return id < first_free_id() ? first_free_id() : id;
    }

    bool contains(TokenId id) const noexcept {
        return id >= first_free_id() && id < num_embeddings_;
    }

private:
    TokenId num_embeddings_;
    TokenId padding_idx_;
};

// ceil(log2(num_embeddings)): sign bits needed to address every id
size_t hyperplane_bits(TokenId num_embeddings) noexcept;

/**
 * Feature hashing of token strings: BLAKE3 digest of the UTF-8 bytes read as
 * a big-endian integer, modulo num_embeddings. Pure.
 */
class CryptoHashQuantizer {
public:
    explicit CryptoHashQuantizer(VocabularyBounds bounds);

    TokenId quantize(std::string_view token) const;
    std::vector<TokenId> quantize(const std::vector<std::string>& tokens) const;

    const VocabularyBounds& bounds() const noexcept { return bounds_; }

private:
    VocabularyBounds bounds_;
};

/**
 * Random-hyperplane LSH of numeric windows.
 *
 * Bit k of the code is 1 when the window's dot product with basis row k is
 * positive; bit 0 is the most significant. The basis is drawn once from a
 * generator owned by this instance and seeded explicitly, so equal seeds
 * and shapes give bit-identical bases.
 */
class RandomHyperplaneQuantizer {
public:
    RandomHyperplaneQuantizer(VocabularyBounds bounds, size_t window_size, uint64_t seed);

    // Throws MalformedInputError if window.size() != window_size()
    TokenId quantize(std::span<const double> window) const;

    // One id per row of `windows`
    std::vector<TokenId> quantize(const WindowMatrix& windows) const;

    // (num_bits, window_size) Gaussian matrix, filled row by row
    static Eigen::MatrixXd generate_basis(size_t rows, size_t cols, uint64_t seed);

    const Eigen::MatrixXd& basis() const noexcept { return basis_; }
    size_t num_bits() const noexcept { return static_cast<size_t>(basis_.rows()); }
    size_t window_size() const noexcept { return static_cast<size_t>(basis_.cols()); }
    uint64_t seed() const noexcept { return seed_; }
    const VocabularyBounds& bounds() const noexcept { return bounds_; }

private:
    template<typename Row>
    TokenId code_of(const Row& projection) const;

    VocabularyBounds bounds_;
    uint64_t seed_;
    Eigen::MatrixXd basis_;
};

/**
 * LSH of token strings: the string is embedded by signed feature hashing of
 * its codepoint unigrams and bigrams into feature_dim buckets, then hashed
 * with random hyperplanes. Strings sharing most character features collide
 * more often than unrelated strings.
 */
class StringLshQuantizer {
public:
    StringLshQuantizer(VocabularyBounds bounds, size_t feature_dim, uint64_t seed);

    Eigen::VectorXd embed(std::string_view token) const;

    TokenId quantize(std::string_view token) const;
    std::vector<TokenId> quantize(const std::vector<std::string>& tokens) const;

    size_t feature_dim() const noexcept { return feature_dim_; }
    const VocabularyBounds& bounds() const noexcept { return hyperplanes_.bounds(); }

private:
    size_t feature_dim_;
    RandomHyperplaneQuantizer hyperplanes_;
};

} // namespace hashtok
