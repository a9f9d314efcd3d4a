// =============================================================================
// N-gram / Skip-gram Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hashtok/gram_generator.hpp"
#include "hashtok/error.hpp"
#include <string>
#include <vector>

using namespace hashtok;

using Grams = std::vector<std::string>;

class GramGeneratorTest : public ::testing::Test {};

TEST_F(GramGeneratorTest, Trigrams) {
    EXPECT_EQ(GramGenerator::ngrams("hello", 3), (Grams{"hel", "ell", "llo"}));
}

TEST_F(GramGeneratorTest, NgramOfWholeWord) {
    EXPECT_EQ(GramGenerator::ngrams("hello", 5), (Grams{"hello"}));
}

TEST_F(GramGeneratorTest, NgramLongerThanWordIsEmpty) {
    EXPECT_TRUE(GramGenerator::ngrams("hi", 3).empty());
    EXPECT_TRUE(GramGenerator::ngrams("", 1).empty());
}

TEST_F(GramGeneratorTest, SkipGrams) {
    EXPECT_EQ(GramGenerator::skipgrams("hello", 2), (Grams{"hlo", "el"}));
    EXPECT_EQ(GramGenerator::skipgrams("hello", 3), (Grams{"hl", "eo", "l"}));
}

TEST_F(GramGeneratorTest, SkipGramOffsetsStopAtWordLength) {
    EXPECT_EQ(GramGenerator::skipgrams("ab", 3), (Grams{"a", "b"}));
}

TEST_F(GramGeneratorTest, CountsCodepointsNotBytes) {
    // 3 Thai codepoints, 9 bytes
    const std::string word = "\xE0\xB8\x81\xE0\xB8\x82\xE0\xB8\x84";
    auto bigrams = GramGenerator::ngrams(word, 2);
    ASSERT_EQ(bigrams.size(), 2u);
    EXPECT_EQ(bigrams[0], "\xE0\xB8\x81\xE0\xB8\x82");
    EXPECT_EQ(bigrams[1], "\xE0\xB8\x82\xE0\xB8\x84");
}

TEST_F(GramGeneratorTest, GramsInConfiguredOrder) {
    GramGenerator gen({3, 2}, {2});
    EXPECT_EQ(gen.grams("abcd"), (Grams{"abc", "bcd", "ab", "bc", "cd", "ac", "bd"}));
}

TEST_F(GramGeneratorTest, DefaultGeneratorProducesNothing) {
    GramGenerator gen;
    EXPECT_TRUE(gen.grams("hello").empty());
}

TEST_F(GramGeneratorTest, RejectsZeroSizes) {
    EXPECT_THROW(GramGenerator({0}, {}), ConfigurationError);
    EXPECT_THROW(GramGenerator({3}, {2, 0}), ConfigurationError);
}
