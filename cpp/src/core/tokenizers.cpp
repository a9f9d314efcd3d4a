#include "hashtok/tokenizers.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/util/utf8.hpp"

namespace hashtok {

namespace {

IdGrid to_grid(const WindowGrid& grid, const std::vector<TokenId>& flat) {
    IdGrid ids(grid.output_height);
    for (size_t i = 0; i < grid.output_height; ++i) {
        const auto row = flat.begin() + static_cast<std::ptrdiff_t>(grid.cell_index(i, 0));
        ids[i].assign(row, row + static_cast<std::ptrdiff_t>(grid.output_width));
    }
    return ids;
}

} // anonymous namespace

// =============================================================================
// BatchExecutor / TextSplitter
// =============================================================================

BatchExecutor::BatchExecutor(bool parallel, size_t num_threads) {
    if (!parallel) return;
    if (num_threads > 0) {
        pool_ = std::make_shared<ThreadPool>(num_threads);
    } else {
        // Non-owning handle on the process-wide pool
        pool_ = std::shared_ptr<ThreadPool>(&get_thread_pool(), [](ThreadPool*) {});
    }
}

std::vector<std::string> TextSplitter::words(std::string_view text) const {
    if (input_word_) {
        return {std::string(text)};
    }
    return segmenter_.segment(text);
}

// =============================================================================
// WordTokenizer
// =============================================================================

WordTokenizer::WordTokenizer(const TokenizerConfig& config)
    : splitter_(config.input_word),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx)),
      executor_(config.parallel_batch, config.num_threads) {
    LOG_DEBUG("WordTokenizer num_embeddings=", config.num_embeddings, " input_word=", config.input_word);
}

std::vector<std::string> WordTokenizer::tokenize(std::string_view text) const {
    return splitter_.words(text);
}

std::vector<TokenId> WordTokenizer::numerize(const std::vector<std::string>& words) const {
    return quantizer_.quantize(words);
}

std::vector<TokenId> WordTokenizer::encode(std::string_view text) const {
    return numerize(tokenize(text));
}

std::vector<std::vector<TokenId>> WordTokenizer::operator()(const std::vector<std::string>& texts) const {
    return executor_.map(texts, [this](const std::string& text) { return encode(text); });
}

// =============================================================================
// NgramTokenizer
// =============================================================================

NgramTokenizer::NgramTokenizer(const TokenizerConfig& config, GramHashing hashing)
    : splitter_(config.input_word),
      grams_(config.ngrams, config.skipngrams),
      hashing_(hashing),
      bounds_(config.num_embeddings, config.padding_idx),
      executor_(config.parallel_batch, config.num_threads) {
    if (hashing_ == GramHashing::Crypto) {
        crypto_.emplace(bounds_);
    } else {
        lsh_.emplace(bounds_, config.lsh_feature_dim, config.random_seed);
    }
    LOG_DEBUG("NgramTokenizer hashing=", hashing_ == GramHashing::Crypto ? "crypto" : "lsh",
              " ngrams=", config.ngrams.size(), " skipngrams=", config.skipngrams.size());
}

std::vector<std::vector<std::string>> NgramTokenizer::tokenize(std::string_view text) const {
    std::vector<std::vector<std::string>> tokens;
    for (const auto& word : splitter_.words(text)) {
        tokens.push_back(grams_.grams(word));
    }
    return tokens;
}

TokenId NgramTokenizer::numerize_gram(std::string_view gram) const {
    return crypto_ ? crypto_->quantize(gram) : lsh_->quantize(gram);
}

std::vector<std::vector<TokenId>> NgramTokenizer::numerize(
        const std::vector<std::vector<std::string>>& grams) const {
    std::vector<std::vector<TokenId>> ids;
    ids.reserve(grams.size());
    for (const auto& word_grams : grams) {
        ids.push_back(crypto_ ? crypto_->quantize(word_grams) : lsh_->quantize(word_grams));
    }
    return ids;
}

std::vector<std::vector<TokenId>> NgramTokenizer::encode(std::string_view text) const {
    return numerize(tokenize(text));
}

std::vector<std::vector<std::vector<TokenId>>> NgramTokenizer::operator()(
        const std::vector<std::string>& texts) const {
    return executor_.map(texts, [this](const std::string& text) { return encode(text); });
}

// =============================================================================
// CharacterTokenizer
// =============================================================================

CharacterTokenizer::CharacterTokenizer(const TokenizerConfig& config)
    : splitter_(config.input_word),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx)),
      executor_(config.parallel_batch, config.num_threads) {}

std::vector<std::vector<std::string>> CharacterTokenizer::tokenize(std::string_view text) const {
    std::vector<std::vector<std::string>> tokens;
    for (const auto& word : splitter_.words(text)) {
        tokens.push_back(util::split_chars(word));
    }
    return tokens;
}

std::vector<std::vector<TokenId>> CharacterTokenizer::numerize(
        const std::vector<std::vector<std::string>>& chars) const {
    std::vector<std::vector<TokenId>> ids;
    ids.reserve(chars.size());
    for (const auto& word_chars : chars) {
        ids.push_back(quantizer_.quantize(word_chars));
    }
    return ids;
}

std::vector<std::vector<TokenId>> CharacterTokenizer::encode(std::string_view text) const {
    return numerize(tokenize(text));
}

std::vector<std::vector<std::vector<TokenId>>> CharacterTokenizer::operator()(
        const std::vector<std::string>& texts) const {
    return executor_.map(texts, [this](const std::string& text) { return encode(text); });
}

// =============================================================================
// PositionalCharacterTokenizer
// =============================================================================

namespace {

PositionalBucketer make_bucketer(const TokenizerConfig& config, PositionPolicy policy) {
    if (policy == PositionPolicy::Rough) {
        return PositionalBucketer::rough(config.max_positional, config.language);
    }
    return PositionalBucketer::precise(config.max_positional);
}

} // anonymous namespace

PositionalCharacterTokenizer::PositionalCharacterTokenizer(const TokenizerConfig& config,
                                                           PositionPolicy policy)
    : splitter_(config.input_word),
      bucketer_(make_bucketer(config, policy)),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx)),
      executor_(config.parallel_batch, config.num_threads) {}

std::vector<PositionedChars> PositionalCharacterTokenizer::tokenize(std::string_view text) const {
    std::vector<PositionedChars> tokens;
    for (const auto& word : splitter_.words(text)) {
        tokens.push_back(bucketer_.positionize(word));
    }
    return tokens;
}

std::vector<PositionedIds> PositionalCharacterTokenizer::numerize(
        const std::vector<PositionedChars>& words) const {
    std::vector<PositionedIds> ids;
    ids.reserve(words.size());
    for (const auto& word : words) {
        ids.push_back({quantizer_.quantize(word.chars), word.positions});
    }
    return ids;
}

std::vector<PositionedIds> PositionalCharacterTokenizer::encode(std::string_view text) const {
    return numerize(tokenize(text));
}

std::vector<std::vector<PositionedIds>> PositionalCharacterTokenizer::operator()(
        const std::vector<std::string>& texts) const {
    return executor_.map(texts, [this](const std::string& text) { return encode(text); });
}

// =============================================================================
// SignalTokenizer
// =============================================================================

SignalTokenizer::SignalTokenizer(const TokenizerConfig& config, SignalTransform transform)
    : transform_(transform),
      extractor_(config.window_size, config.stride, config.padding_value),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx),
                 config.window_size, config.random_seed),
      executor_(config.parallel_batch, config.num_threads) {
    LOG_DEBUG("SignalTokenizer window_size=", config.window_size, " stride=", config.stride,
              " derivative=", transform_ == SignalTransform::Derivative);
}

WindowBatch SignalTokenizer::tokenize(std::span<const double> signal) const {
    if (transform_ == SignalTransform::Derivative) {
        HASHTOK_CHECK_INPUT(signal.size() >= 2,
                            "Derivative needs at least 2 samples, got " + std::to_string(signal.size()));
        const Signal diff = first_difference(signal);
        return extractor_.extract(diff);
    }
    return extractor_.extract(signal);
}

std::vector<TokenId> SignalTokenizer::numerize(const WindowBatch& windows) const {
    return quantizer_.quantize(windows.windows);
}

std::vector<TokenId> SignalTokenizer::encode(std::span<const double> signal) const {
    return numerize(tokenize(signal));
}

std::vector<std::vector<TokenId>> SignalTokenizer::operator()(const std::vector<Signal>& signals) const {
    return executor_.map(signals, [this](const Signal& signal) { return encode(signal); });
}

// =============================================================================
// ImageTokenizer
// =============================================================================

ImageTokenizer::ImageTokenizer(const TokenizerConfig& config)
    : extractor_(config.window_height, config.window_width, config.stride, config.stride,
                 config.padding_value),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx),
                 config.window_height * config.window_width, config.random_seed),
      executor_(config.parallel_batch, config.num_threads) {
    LOG_DEBUG("ImageTokenizer window=", config.window_height, "x", config.window_width,
              " stride=", config.stride);
}

WindowGrid ImageTokenizer::tokenize(const Image& image) const {
    return extractor_.extract(image);
}

IdGrid ImageTokenizer::numerize(const WindowGrid& grid) const {
    return to_grid(grid, quantizer_.quantize(grid.windows));
}

IdGrid ImageTokenizer::encode(const Image& image) const {
    return numerize(tokenize(image));
}

std::vector<IdGrid> ImageTokenizer::operator()(const std::vector<Image>& images) const {
    return executor_.map(images, [this](const Image& image) { return encode(image); });
}

// =============================================================================
// SpectrogramTokenizer
// =============================================================================

SpectrogramTokenizer::SpectrogramTokenizer(const TokenizerConfig& config)
    : transform_(config.spectrogram),
      extractor_(config.window_size, config.window_size, config.stride, config.stride,
                 config.padding_value),
      quantizer_(VocabularyBounds(config.num_embeddings, config.padding_idx),
                 config.window_size * config.window_size, config.random_seed),
      executor_(config.parallel_batch, config.num_threads) {}

WindowGrid SpectrogramTokenizer::tokenize(std::span<const double> signal) const {
    return extractor_.extract(transform_(signal));
}

IdGrid SpectrogramTokenizer::numerize(const WindowGrid& grid) const {
    return to_grid(grid, quantizer_.quantize(grid.windows));
}

IdGrid SpectrogramTokenizer::encode(std::span<const double> signal) const {
    return numerize(tokenize(signal));
}

std::vector<IdGrid> SpectrogramTokenizer::operator()(const std::vector<Signal>& signals) const {
    return executor_.map(signals, [this](const Signal& signal) { return encode(signal); });
}

} // namespace hashtok
