/**
 * Modality facades
 *
 * Each facade binds one tokenize strategy (how raw input becomes tokens) to
 * one numerize strategy (how tokens become ids):
 *
 *   tokenize(x)        raw input -> token structure
 *   numerize(tokens)   token structure -> ids
 *   encode(x)          numerize(tokenize(x))
 *   operator()(xs)     encode of every item, in input order
 *
 * Facades are immutable after construction and safe to share between
 * threads. A batch call fails as a whole with the exception of the first
 * failing item.
 */

#pragma once

#include "hashtok/config.hpp"
#include "hashtok/gram_generator.hpp"
#include "hashtok/hash_quantizer.hpp"
#include "hashtok/positional_bucketer.hpp"
#include "hashtok/signal_processing.hpp"
#include "hashtok/thread_pool.hpp"
#include "hashtok/types.hpp"
#include "hashtok/window_extractor.hpp"
#include "hashtok/word_segmenter.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace hashtok {

// =============================================================================
// Batch execution
// =============================================================================

/**
 * Maps a function over a batch, on a thread pool when one is configured.
 * Output order matches input order.
 */
class BatchExecutor {
public:
    // parallel = false runs batches inline; num_threads = 0 uses the shared pool
    BatchExecutor(bool parallel, size_t num_threads);

    template<typename In, typename Fn>
    auto map(const std::vector<In>& inputs, Fn&& fn) const
        -> std::vector<std::invoke_result_t<Fn&, const In&>> {
        using Out = std::invoke_result_t<Fn&, const In&>;
        std::vector<Out> outputs(inputs.size());

        if (!pool_ || inputs.size() < 2) {
            for (size_t i = 0; i < inputs.size(); ++i) {
                outputs[i] = fn(inputs[i]);
            }
            return outputs;
        }

        pool_->parallel_for_index(0, inputs.size(), [&](size_t i) {
            outputs[i] = fn(inputs[i]);
        });
        return outputs;
    }

    bool parallel() const noexcept { return pool_ != nullptr; }

private:
    std::shared_ptr<ThreadPool> pool_;
};

// Words of a text, or the whole text when input_word is set
class TextSplitter {
public:
    explicit TextSplitter(bool input_word) : input_word_(input_word) {}

    std::vector<std::string> words(std::string_view text) const;

    bool input_word() const noexcept { return input_word_; }

private:
    bool input_word_;
    WordSegmenter segmenter_;
};

// =============================================================================
// Text facades
// =============================================================================

class WordTokenizer {
public:
    explicit WordTokenizer(const TokenizerConfig& config);

    std::vector<std::string> tokenize(std::string_view text) const;
    std::vector<TokenId> numerize(const std::vector<std::string>& words) const;
    std::vector<TokenId> encode(std::string_view text) const;

    std::vector<std::vector<TokenId>> operator()(const std::vector<std::string>& texts) const;

    const VocabularyBounds& bounds() const noexcept { return quantizer_.bounds(); }

private:
    TextSplitter splitter_;
    CryptoHashQuantizer quantizer_;
    BatchExecutor executor_;
};

enum class GramHashing {
    Crypto,  // BLAKE3 of each gram
    Lsh,     // random hyperplanes over the gram's character features
};

class NgramTokenizer {
public:
    NgramTokenizer(const TokenizerConfig& config, GramHashing hashing = GramHashing::Crypto);

    // Grams of every word, n-grams then skip-grams
    std::vector<std::vector<std::string>> tokenize(std::string_view text) const;
    std::vector<std::vector<TokenId>> numerize(const std::vector<std::vector<std::string>>& grams) const;
    std::vector<std::vector<TokenId>> encode(std::string_view text) const;

    std::vector<std::vector<std::vector<TokenId>>> operator()(const std::vector<std::string>& texts) const;

    // Id of a single gram
    TokenId numerize_gram(std::string_view gram) const;

    GramHashing hashing() const noexcept { return hashing_; }
    const VocabularyBounds& bounds() const noexcept { return bounds_; }

private:
    TextSplitter splitter_;
    GramGenerator grams_;
    GramHashing hashing_;
    VocabularyBounds bounds_;
    std::optional<CryptoHashQuantizer> crypto_;
    std::optional<StringLshQuantizer> lsh_;
    BatchExecutor executor_;
};

class CharacterTokenizer {
public:
    explicit CharacterTokenizer(const TokenizerConfig& config);

    // Characters of every word
    std::vector<std::vector<std::string>> tokenize(std::string_view text) const;
    std::vector<std::vector<TokenId>> numerize(const std::vector<std::vector<std::string>>& chars) const;
    std::vector<std::vector<TokenId>> encode(std::string_view text) const;

    std::vector<std::vector<std::vector<TokenId>>> operator()(const std::vector<std::string>& texts) const;

    const VocabularyBounds& bounds() const noexcept { return quantizer_.bounds(); }

private:
    TextSplitter splitter_;
    CryptoHashQuantizer quantizer_;
    BatchExecutor executor_;
};

/**
 * Characters with a coarse in-word position: the character index (Precise)
 * or the index of the containing syllable (Rough), clamped at
 * max_positional - 1.
 */
class PositionalCharacterTokenizer {
public:
    PositionalCharacterTokenizer(const TokenizerConfig& config, PositionPolicy policy);

    std::vector<PositionedChars> tokenize(std::string_view text) const;
    std::vector<PositionedIds> numerize(const std::vector<PositionedChars>& words) const;
    std::vector<PositionedIds> encode(std::string_view text) const;

    std::vector<std::vector<PositionedIds>> operator()(const std::vector<std::string>& texts) const;

    PositionPolicy policy() const noexcept { return bucketer_.policy(); }
    const VocabularyBounds& bounds() const noexcept { return quantizer_.bounds(); }

private:
    TextSplitter splitter_;
    PositionalBucketer bucketer_;
    CryptoHashQuantizer quantizer_;
    BatchExecutor executor_;
};

// =============================================================================
// Numeric facades
// =============================================================================

enum class SignalTransform {
    Raw,
    Derivative,  // first difference before windowing
};

class SignalTokenizer {
public:
    SignalTokenizer(const TokenizerConfig& config, SignalTransform transform = SignalTransform::Raw);

    // (output_length, window_size) windows
    WindowBatch tokenize(std::span<const double> signal) const;
    std::vector<TokenId> numerize(const WindowBatch& windows) const;
    std::vector<TokenId> encode(std::span<const double> signal) const;

    std::vector<std::vector<TokenId>> operator()(const std::vector<Signal>& signals) const;

    SignalTransform transform() const noexcept { return transform_; }
    const RandomHyperplaneQuantizer& quantizer() const noexcept { return quantizer_; }

private:
    SignalTransform transform_;
    WindowExtractor extractor_;
    RandomHyperplaneQuantizer quantizer_;
    BatchExecutor executor_;
};

// Ids of a window grid as an (output_height, output_width) table
using IdGrid = std::vector<std::vector<TokenId>>;

class ImageTokenizer {
public:
    explicit ImageTokenizer(const TokenizerConfig& config);

    WindowGrid tokenize(const Image& image) const;
    IdGrid numerize(const WindowGrid& grid) const;
    IdGrid encode(const Image& image) const;

    std::vector<IdGrid> operator()(const std::vector<Image>& images) const;

    const RandomHyperplaneQuantizer& quantizer() const noexcept { return quantizer_; }

private:
    WindowExtractor2D extractor_;
    RandomHyperplaneQuantizer quantizer_;
    BatchExecutor executor_;
};

/**
 * Audio through a dB spectrogram: silence is trimmed, the STFT magnitude is
 * windowed into window_size x window_size patches and every patch hashed
 * with random hyperplanes.
 */
class SpectrogramTokenizer {
public:
    explicit SpectrogramTokenizer(const TokenizerConfig& config);

    // The dB spectrogram the windows are cut from
    Image spectrogram(std::span<const double> signal) const { return transform_(signal); }

    WindowGrid tokenize(std::span<const double> signal) const;
    IdGrid numerize(const WindowGrid& grid) const;
    IdGrid encode(std::span<const double> signal) const;

    std::vector<IdGrid> operator()(const std::vector<Signal>& signals) const;

    const RandomHyperplaneQuantizer& quantizer() const noexcept { return quantizer_; }

private:
    SpectrogramTransform transform_;
    WindowExtractor2D extractor_;
    RandomHyperplaneQuantizer quantizer_;
    BatchExecutor executor_;
};

} // namespace hashtok
