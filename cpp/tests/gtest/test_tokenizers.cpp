// =============================================================================
// Modality Tokenizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hashtok/tokenizers.hpp"
#include "hashtok/error.hpp"
#include <chrono>
#include <cmath>
#include <future>
#include <string>
#include <vector>

using namespace hashtok;

class TokenizerTest : public ::testing::Test {
protected:
    static TokenizerConfig config_for(Modality modality, TokenId num_embeddings = 1000) {
        TokenizerConfig cfg = TokenizerConfig::defaults(modality);
        cfg.num_embeddings = num_embeddings;
        return cfg;
    }

    static void expect_in_range(const std::vector<TokenId>& ids, const TokenizerConfig& cfg) {
        for (TokenId id : ids) {
            EXPECT_GE(id, cfg.padding_idx + SpecialTokens::count);
            EXPECT_LT(id, cfg.num_embeddings);
        }
    }

    static Signal ramp(size_t n, double scale = 1.0) {
        Signal s(n);
        for (size_t i = 0; i < n; ++i) {
            s[i] = scale * std::sin(0.01 * static_cast<double>(i * i % 977));
        }
        return s;
    }

    const std::vector<std::string> texts = {
        "The quick brown fox.",
        "jumps over the lazy dog",
        "",
        "hashing, not lookup!",
    };
};

// =============================================================================
// Text
// =============================================================================

TEST_F(TokenizerTest, WordTokenizeAndNumerize) {
    auto cfg = config_for(Modality::Word);
    WordTokenizer tokenizer(cfg);

    EXPECT_EQ(tokenizer.tokenize("Hello, world"), (std::vector<std::string>{"Hello", ",", "world"}));

    CryptoHashQuantizer reference{VocabularyBounds(1000)};
    auto ids = tokenizer.encode("Hello, world");
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], reference.quantize("Hello"));
    EXPECT_EQ(ids[2], reference.quantize("world"));
    expect_in_range(ids, cfg);
}

TEST_F(TokenizerTest, InputWordSkipsSegmentation) {
    auto cfg = config_for(Modality::Word);
    cfg.input_word = true;
    WordTokenizer tokenizer(cfg);

    EXPECT_EQ(tokenizer.tokenize("two words"), (std::vector<std::string>{"two words"}));
}

TEST_F(TokenizerTest, BatchPreservesOrder) {
    auto cfg = config_for(Modality::Word);
    cfg.num_threads = 3;
    WordTokenizer tokenizer(cfg);

    auto batch = tokenizer(texts);
    ASSERT_EQ(batch.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(batch[i], tokenizer.encode(texts[i])) << i;
    }
    EXPECT_TRUE(batch[2].empty());
}

TEST_F(TokenizerTest, SerialAndParallelBatchesAgree) {
    auto parallel_cfg = config_for(Modality::Character);
    auto serial_cfg = parallel_cfg;
    serial_cfg.parallel_batch = false;

    CharacterTokenizer parallel(parallel_cfg);
    CharacterTokenizer serial(serial_cfg);
    EXPECT_EQ(parallel(texts), serial(texts));
}

TEST_F(TokenizerTest, NgramTokenize) {
    auto cfg = config_for(Modality::Ngram);
    cfg.ngrams = {3};
    cfg.skipngrams = {2};
    NgramTokenizer tokenizer(cfg);

    auto grams = tokenizer.tokenize("hello hi");
    ASSERT_EQ(grams.size(), 2u);
    EXPECT_EQ(grams[0], (std::vector<std::string>{"hel", "ell", "llo", "hlo", "el"}));
    EXPECT_EQ(grams[1], (std::vector<std::string>{"h", "i"}));

    auto ids = tokenizer.numerize(grams);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0].size(), 5u);
    EXPECT_EQ(ids[0][0], tokenizer.numerize_gram("hel"));
    expect_in_range(ids[0], cfg);
}

TEST_F(TokenizerTest, LshNgramDeterministicAcrossInstances) {
    auto cfg = config_for(Modality::LshNgram, 1 << 14);
    cfg.random_seed = 11;
    NgramTokenizer a(cfg, GramHashing::Lsh);
    NgramTokenizer b(cfg, GramHashing::Lsh);

    EXPECT_EQ(a.hashing(), GramHashing::Lsh);
    EXPECT_EQ(a.encode("tokenization"), b.encode("tokenization"));
    for (const auto& word : a.encode("locality sensitive")) {
        expect_in_range(word, cfg);
    }
}

TEST_F(TokenizerTest, CharacterTokenize) {
    auto cfg = config_for(Modality::Character);
    CharacterTokenizer tokenizer(cfg);

    auto chars = tokenizer.tokenize("ab c");
    EXPECT_EQ(chars, (std::vector<std::vector<std::string>>{{"a", "b"}, {"c"}}));

    auto ids = tokenizer.numerize(chars);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0][0], CryptoHashQuantizer(VocabularyBounds(1000)).quantize("a"));
}

TEST_F(TokenizerTest, PositionalPrecise) {
    auto cfg = config_for(Modality::PositionalPrecise);
    cfg.max_positional = 10;
    PositionalCharacterTokenizer tokenizer(cfg, PositionPolicy::Precise);

    auto words = tokenizer.encode("abcdefghijkl xy");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0].positions, (std::vector<Position>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 9, 9}));
    EXPECT_EQ(words[0].ids.size(), 12u);
    EXPECT_EQ(words[1].positions, (std::vector<Position>{0, 1}));
    expect_in_range(words[0].ids, cfg);
}

TEST_F(TokenizerTest, PositionalRough) {
    auto cfg = config_for(Modality::PositionalRough);
    PositionalCharacterTokenizer tokenizer(cfg, PositionPolicy::Rough);

    auto words = tokenizer.encode("hello");
    ASSERT_EQ(words.size(), 1u);
    EXPECT_EQ(words[0].positions, (std::vector<Position>{0, 0, 0, 1, 1}));
    EXPECT_EQ(tokenizer.policy(), PositionPolicy::Rough);
}

TEST_F(TokenizerTest, PositionalRoughRejectsUnknownLanguage) {
    auto cfg = config_for(Modality::PositionalRough);
    cfg.language = "xx";
    EXPECT_THROW((PositionalCharacterTokenizer{cfg, PositionPolicy::Rough}), ConfigurationError);
}

// =============================================================================
// Signals
// =============================================================================

TEST_F(TokenizerTest, SignalWindowCount) {
    auto cfg = config_for(Modality::Signal);
    cfg.window_size = 50;
    cfg.stride = 20;
    SignalTokenizer tokenizer(cfg);

    Signal s = ramp(333);
    WindowBatch windows = tokenizer.tokenize(s);
    // ceil((333 - 50) / 20 + 1) = 16
    EXPECT_EQ(windows.output_length(), 16u);
    EXPECT_EQ(windows.window_size(), 50u);

    auto ids = tokenizer.encode(s);
    EXPECT_EQ(ids.size(), 16u);
    expect_in_range(ids, cfg);
    EXPECT_EQ(tokenizer.quantizer().num_bits(), 10u);
}

TEST_F(TokenizerTest, SignalDeterministicPerSeed) {
    auto cfg = config_for(Modality::Signal);
    cfg.window_size = 16;
    cfg.stride = 4;
    cfg.random_seed = 5;

    SignalTokenizer a(cfg);
    SignalTokenizer b(cfg);
    Signal s = ramp(200);
    EXPECT_EQ(a.encode(s), b.encode(s));
}

TEST_F(TokenizerTest, SignalDerivativeWindowsTheDifference) {
    auto cfg = config_for(Modality::SignalDerivative);
    cfg.window_size = 4;
    cfg.stride = 4;
    SignalTokenizer tokenizer(cfg, SignalTransform::Derivative);

    Signal s = {0.0, 1.0, 3.0, 6.0, 10.0};
    WindowBatch windows = tokenizer.tokenize(s);
    ASSERT_EQ(windows.output_length(), 1u);
    EXPECT_DOUBLE_EQ(windows.windows(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(windows.windows(0, 3), 4.0);

    EXPECT_THROW(tokenizer.encode(Signal{1.0}), MalformedInputError);
}

TEST_F(TokenizerTest, SignalTooShortIsMalformed) {
    auto cfg = config_for(Modality::Signal);
    cfg.window_size = 10;
    cfg.stride = 1;
    SignalTokenizer tokenizer(cfg);

    EXPECT_THROW(tokenizer.encode(Signal(5, 1.0)), MalformedInputError);
    EXPECT_THROW(tokenizer.encode(Signal{}), MalformedInputError);
}

TEST_F(TokenizerTest, BatchFailsOnFirstBadItem) {
    auto cfg = config_for(Modality::Signal);
    cfg.window_size = 10;
    cfg.stride = 5;
    cfg.num_threads = 2;
    SignalTokenizer tokenizer(cfg);

    std::vector<Signal> signals = {ramp(100), ramp(3), ramp(100)};
    EXPECT_THROW(tokenizer(signals), MalformedInputError);
}

TEST_F(TokenizerTest, BatchFromSharedPoolWorkers) {
    // Default config batches on the shared pool; run batches from inside it
    auto cfg = config_for(Modality::Word);
    ASSERT_EQ(cfg.num_threads, 0u);
    ASSERT_TRUE(cfg.parallel_batch);
    const WordTokenizer tokenizer(cfg);
    const std::vector<std::string> batch = {"a b", "c d", "e f"};
    const auto expected = WordTokenizer(config_for(Modality::Word))(batch);

    ThreadPool& shared = get_thread_pool();
    std::vector<std::future<std::vector<std::vector<TokenId>>>> results;
    for (size_t t = 0; t < shared.size(); ++t) {
        results.push_back(shared.submit([&tokenizer, &batch] { return tokenizer(batch); }));
    }

    for (auto& f : results) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(10)), std::future_status::ready);
        EXPECT_EQ(f.get(), expected);
    }
}

TEST_F(TokenizerTest, ImageGrid) {
    auto cfg = config_for(Modality::Image);
    cfg.window_height = 3;
    cfg.window_width = 3;
    cfg.stride = 2;
    ImageTokenizer tokenizer(cfg);

    Image image(7, 10);
    for (Eigen::Index r = 0; r < image.rows(); ++r) {
        for (Eigen::Index c = 0; c < image.cols(); ++c) {
            image(r, c) = std::cos(0.7 * static_cast<double>(r) + 0.3 * static_cast<double>(c * c));
        }
    }

    IdGrid ids = tokenizer.encode(image);
    // Height: ceil((7 - 3) / 2 + 1) = 3, width: ceil((10 - 3) / 2 + 1) = 5
    ASSERT_EQ(ids.size(), 3u);
    for (const auto& row : ids) {
        ASSERT_EQ(row.size(), 5u);
        expect_in_range(row, cfg);
    }

    // Cell (1, 2) is the hash of the window at rows 2..4, columns 4..6
    WindowGrid grid = tokenizer.tokenize(image);
    Image cell = grid.window(1, 2);
    std::vector<double> flat(cell.data(), cell.data() + cell.size());
    EXPECT_EQ(ids[1][2], tokenizer.quantizer().quantize(flat));
    EXPECT_DOUBLE_EQ(cell(0, 0), image(2, 4));
}

TEST_F(TokenizerTest, SpectrogramGrid) {
    auto cfg = config_for(Modality::Spectrogram);
    cfg.spectrogram.n_fft = 32;
    cfg.spectrogram.hop_length = 8;
    cfg.window_size = 3;
    SpectrogramTokenizer tokenizer(cfg);

    Signal s = ramp(256, 0.5);
    Image db = tokenizer.spectrogram(s);
    EXPECT_EQ(db.rows(), 17);
    EXPECT_LE(db.maxCoeff(), 1e-9);

    IdGrid ids = tokenizer.encode(s);
    // stride 1, window 3: two fewer windows than bins and frames
    EXPECT_EQ(ids.size(), static_cast<size_t>(db.rows() - 2));
    EXPECT_EQ(ids.front().size(), static_cast<size_t>(db.cols() - 2));
    EXPECT_EQ(tokenizer.quantizer().window_size(), 9u);

    auto batch = tokenizer(std::vector<Signal>{s, s});
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0], ids);
    EXPECT_EQ(batch[1], ids);
}

TEST_F(TokenizerTest, ConstructionRejectsBadVocabulary) {
    auto cfg = config_for(Modality::Word, 3);
    EXPECT_THROW(WordTokenizer{cfg}, ConfigurationError);

    cfg.num_embeddings = 0;
    EXPECT_THROW(SignalTokenizer{cfg}, ConfigurationError);
}
