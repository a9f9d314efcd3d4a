// =============================================================================
// Hash Quantizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hashtok/hash_quantizer.hpp"
#include "hashtok/blake3.hpp"
#include "hashtok/error.hpp"
#include <algorithm>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace hashtok;

// =============================================================================
// Vocabulary bounds
// =============================================================================

class VocabularyBoundsTest : public ::testing::Test {};

TEST_F(VocabularyBoundsTest, ReservedRangeFollowsPaddingIdx) {
    VocabularyBounds bounds(100, 3);
    EXPECT_EQ(bounds.first_free_id(), 8);
    EXPECT_EQ(SpecialTokens::id_of("<PAD>", 3), 3);
    EXPECT_EQ(SpecialTokens::id_of("<UNK>", 3), 7);
    EXPECT_EQ(SpecialTokens::id_of("hello", 3), -1);
}

TEST_F(VocabularyBoundsTest, ReduceLiftsReservedIds) {
    VocabularyBounds bounds(100, 0);
    EXPECT_EQ(bounds.reduce(0), 5);
    EXPECT_EQ(bounds.reduce(4), 5);
    EXPECT_EQ(bounds.reduce(5), 5);
    EXPECT_EQ(bounds.reduce(99), 99);
    EXPECT_EQ(bounds.reduce(103), 5);
    EXPECT_EQ(bounds.reduce(142), 42);
}

TEST_F(VocabularyBoundsTest, RejectsUnusableRanges) {
    EXPECT_THROW(VocabularyBounds(0), ConfigurationError);
    EXPECT_THROW(VocabularyBounds(-10), ConfigurationError);
    EXPECT_THROW(VocabularyBounds(5, 0), ConfigurationError);
    EXPECT_THROW(VocabularyBounds(100, 95), ConfigurationError);
    EXPECT_THROW(VocabularyBounds(100, -1), ConfigurationError);
    EXPECT_THROW(VocabularyBounds((TokenId(1) << 40) + 1), ConfigurationError);
    EXPECT_NO_THROW(VocabularyBounds(6, 0));
    EXPECT_NO_THROW(VocabularyBounds(TokenId(1) << 40));
}

TEST_F(VocabularyBoundsTest, HyperplaneBits) {
    EXPECT_EQ(hyperplane_bits(1000), 10u);
    EXPECT_EQ(hyperplane_bits(1024), 10u);
    EXPECT_EQ(hyperplane_bits(1025), 11u);
    EXPECT_EQ(hyperplane_bits(6), 3u);
    EXPECT_EQ(hyperplane_bits(TokenId(1) << 40), 40u);
}

// =============================================================================
// Crypto
// =============================================================================

class CryptoHashQuantizerTest : public ::testing::Test {
protected:
    CryptoHashQuantizer quantizer{VocabularyBounds(1000, 0)};
};

TEST_F(CryptoHashQuantizerTest, DigestModuloVocabulary) {
    const uint64_t raw = Blake3Hasher::hash(std::string_view("hello")).mod(1000);
    const TokenId expected = std::max<TokenId>(static_cast<TokenId>(raw), 5);
    EXPECT_EQ(quantizer.quantize("hello"), expected);
}

TEST_F(CryptoHashQuantizerTest, DeterministicAcrossInstances) {
    CryptoHashQuantizer other{VocabularyBounds(1000, 0)};
    for (const char* token : {"a", "hello", "world", "\xE0\xB8\x81", ""}) {
        EXPECT_EQ(quantizer.quantize(token), other.quantize(token)) << token;
        EXPECT_EQ(quantizer.quantize(token), quantizer.quantize(token)) << token;
    }
}

TEST_F(CryptoHashQuantizerTest, IdsStayInHashedRange) {
    CryptoHashQuantizer small{VocabularyBounds(12, 4)};
    for (int i = 0; i < 500; ++i) {
        const TokenId id = small.quantize("token" + std::to_string(i));
        EXPECT_GE(id, 9);
        EXPECT_LT(id, 12);
    }
}

TEST_F(CryptoHashQuantizerTest, BatchMatchesSingle) {
    std::vector<std::string> tokens = {"the", "quick", "brown", "fox"};
    auto ids = quantizer.quantize(tokens);
    ASSERT_EQ(ids.size(), tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(ids[i], quantizer.quantize(tokens[i]));
    }
}

// =============================================================================
// Random hyperplanes
// =============================================================================

class RandomHyperplaneQuantizerTest : public ::testing::Test {
protected:
    static std::vector<double> random_window(size_t n, uint32_t seed) {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        std::vector<double> v(n);
        for (auto& x : v) x = dist(rng);
        return v;
    }
};

TEST_F(RandomHyperplaneQuantizerTest, BasisShape) {
    RandomHyperplaneQuantizer q(VocabularyBounds(1000), 16, 0);
    EXPECT_EQ(q.num_bits(), 10u);
    EXPECT_EQ(q.window_size(), 16u);
    EXPECT_EQ(q.basis().rows(), 10);
    EXPECT_EQ(q.basis().cols(), 16);
}

TEST_F(RandomHyperplaneQuantizerTest, SameSeedSameBasis) {
    RandomHyperplaneQuantizer a(VocabularyBounds(1000), 16, 42);
    RandomHyperplaneQuantizer b(VocabularyBounds(1000), 16, 42);
    RandomHyperplaneQuantizer c(VocabularyBounds(1000), 16, 43);

    EXPECT_TRUE(a.basis() == b.basis());
    EXPECT_FALSE(a.basis() == c.basis());
    EXPECT_TRUE(a.basis() == RandomHyperplaneQuantizer::generate_basis(10, 16, 42));
}

TEST_F(RandomHyperplaneQuantizerTest, BasisIsPortableBoxMuller) {
    // Box-Muller over std::mt19937_64(0); the engine output is fixed by the standard
    Eigen::MatrixXd basis = RandomHyperplaneQuantizer::generate_basis(2, 3, 0);
    EXPECT_NEAR(basis(0, 0), 1.9128045292843205, 1e-12);
    EXPECT_NEAR(basis(0, 1), -0.09447956112584306, 1e-12);
    EXPECT_NEAR(basis(0, 2), -2.079407906239395, 1e-12);

    Eigen::MatrixXd other = RandomHyperplaneQuantizer::generate_basis(1, 3, 42);
    EXPECT_NEAR(other(0, 0), -0.4812176998018449, 1e-12);
    EXPECT_NEAR(other(0, 1), -0.5745368738983057, 1e-12);
    EXPECT_NEAR(other(0, 2), 0.49458385623521345, 1e-12);
}

TEST_F(RandomHyperplaneQuantizerTest, CodeIsSignPatternMostSignificantFirst) {
    RandomHyperplaneQuantizer q(VocabularyBounds(1 << 12), 8, 7);
    auto window = random_window(8, 1);

    Eigen::Map<const Eigen::VectorXd> v(window.data(), 8);
    const Eigen::VectorXd projection = q.basis() * v;

    uint64_t code = 0;
    for (Eigen::Index k = 0; k < projection.size(); ++k) {
        code = code * 2 + (projection(k) > 0.0 ? 1 : 0);
    }
    const TokenId expected = std::max<TokenId>(static_cast<TokenId>(code % (1 << 12)), 5);

    EXPECT_EQ(q.quantize(window), expected);
}

TEST_F(RandomHyperplaneQuantizerTest, ZeroWindowMapsToFirstFreeId) {
    RandomHyperplaneQuantizer q(VocabularyBounds(1000, 2), 4, 0);
    std::vector<double> zeros(4, 0.0);
    EXPECT_EQ(q.quantize(zeros), 7);
}

TEST_F(RandomHyperplaneQuantizerTest, BatchMatchesRowByRow) {
    RandomHyperplaneQuantizer q(VocabularyBounds(5000), 6, 3);

    WindowMatrix windows(20, 6);
    for (Eigen::Index r = 0; r < windows.rows(); ++r) {
        auto w = random_window(6, static_cast<uint32_t>(r));
        for (Eigen::Index c = 0; c < 6; ++c) windows(r, c) = w[static_cast<size_t>(c)];
    }

    auto ids = q.quantize(windows);
    ASSERT_EQ(ids.size(), 20u);
    for (Eigen::Index r = 0; r < windows.rows(); ++r) {
        std::vector<double> row(windows.row(r).data(), windows.row(r).data() + 6);
        EXPECT_EQ(ids[static_cast<size_t>(r)], q.quantize(row));
        EXPECT_TRUE(q.bounds().contains(ids[static_cast<size_t>(r)]));
    }
}

TEST_F(RandomHyperplaneQuantizerTest, ScaleInvariant) {
    RandomHyperplaneQuantizer q(VocabularyBounds(1000), 8, 0);
    auto window = random_window(8, 9);
    auto scaled = window;
    for (auto& x : scaled) x *= 3.5;
    EXPECT_EQ(q.quantize(window), q.quantize(scaled));
}

TEST_F(RandomHyperplaneQuantizerTest, WrongWindowLengthIsMalformedInput) {
    RandomHyperplaneQuantizer q(VocabularyBounds(1000), 8, 0);
    std::vector<double> short_window(7, 1.0);
    EXPECT_THROW(q.quantize(short_window), MalformedInputError);
    EXPECT_THROW(q.quantize(WindowMatrix::Zero(3, 9)), MalformedInputError);
}

TEST_F(RandomHyperplaneQuantizerTest, RejectsZeroWindow) {
    EXPECT_THROW(RandomHyperplaneQuantizer(VocabularyBounds(1000), 0, 0), ConfigurationError);
}

// =============================================================================
// String LSH
// =============================================================================

class StringLshQuantizerTest : public ::testing::Test {
protected:
    StringLshQuantizer quantizer{VocabularyBounds(1 << 16), 64, 0};
};

TEST_F(StringLshQuantizerTest, EmbeddingCountsFeatures) {
    // "abc": 3 unigrams + 2 bigrams, each adding +-1 to one bucket
    Eigen::VectorXd e = quantizer.embed("abc");
    ASSERT_EQ(e.size(), 64);
    EXPECT_LE(e.cwiseAbs().sum(), 5.0);
    // Five +-1 contributions always sum to an odd number
    EXPECT_EQ(std::abs(static_cast<int>(e.sum())) % 2, 1);
    EXPECT_TRUE(quantizer.embed("").isZero());
}

TEST_F(StringLshQuantizerTest, DeterministicForSameSeed) {
    StringLshQuantizer other{VocabularyBounds(1 << 16), 64, 0};
    for (const char* gram : {"hel", "ell", "llo", "hlo"}) {
        EXPECT_EQ(quantizer.quantize(gram), other.quantize(gram)) << gram;
    }
}

TEST_F(StringLshQuantizerTest, IdsStayInHashedRange) {
    StringLshQuantizer small{VocabularyBounds(40, 10), 16, 5};
    for (int i = 0; i < 200; ++i) {
        const TokenId id = small.quantize("g" + std::to_string(i));
        EXPECT_GE(id, 15);
        EXPECT_LT(id, 40);
    }
}

TEST_F(StringLshQuantizerTest, RejectsZeroFeatureDim) {
    EXPECT_THROW(StringLshQuantizer(VocabularyBounds(1000), 0, 0), ConfigurationError);
}
