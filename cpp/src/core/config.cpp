#include "hashtok/config.hpp"
#include "hashtok/hash_quantizer.hpp"
#include "hashtok/syllable_segmenter.hpp"

#include <fstream>

namespace hashtok {

namespace {

struct ModalityName {
    Modality modality;
    const char* name;
};

constexpr ModalityName modality_names[] = {
    {Modality::Word,              "word"},
    {Modality::Ngram,             "ngram"},
    {Modality::LshNgram,          "lsh-ngram"},
    {Modality::Character,         "char"},
    {Modality::PositionalRough,   "positional-rough"},
    {Modality::PositionalPrecise, "positional-precise"},
    {Modality::Signal,            "signal"},
    {Modality::SignalDerivative,  "signal-derivative"},
    {Modality::Image,             "image"},
    {Modality::Spectrogram,       "spectrogram"},
};

} // anonymous namespace

Modality parse_modality(std::string_view name) {
    for (const auto& entry : modality_names) {
        if (name == entry.name) return entry.modality;
    }

    std::string known;
    for (const auto& entry : modality_names) {
        if (!known.empty()) known += ", ";
        known += entry.name;
    }
    throw ConfigurationError("Unknown modality '" + std::string(name) + "'", __func__,
                             "Use one of: " + known);
}

const char* to_string(Modality modality) {
    for (const auto& entry : modality_names) {
        if (entry.modality == modality) return entry.name;
    }
    return "unknown";
}

const std::vector<Modality>& all_modalities() {
    static const std::vector<Modality> modalities = [] {
        std::vector<Modality> out;
        for (const auto& entry : modality_names) out.push_back(entry.modality);
        return out;
    }();
    return modalities;
}

bool is_text_modality(Modality modality) {
    switch (modality) {
        case Modality::Word:
        case Modality::Ngram:
        case Modality::LshNgram:
        case Modality::Character:
        case Modality::PositionalRough:
        case Modality::PositionalPrecise:
            return true;
        default:
            return false;
    }
}

TokenizerConfig TokenizerConfig::defaults(Modality modality) {
    TokenizerConfig cfg;
    cfg.modality = modality;

    switch (modality) {
        case Modality::Signal:
        case Modality::SignalDerivative:
            cfg.window_size = 1000;
            cfg.stride = 100;
            cfg.padding_value = 0.0;
            break;
        case Modality::Image:
            cfg.window_height = 9;
            cfg.window_width = 9;
            cfg.stride = 1;
            cfg.padding_value = 0.0;
            break;
        case Modality::Spectrogram:
            cfg.window_size = 9;
            cfg.stride = 1;
            cfg.padding_value = -80.0;
            break;
        default:
            break;
    }
    return cfg;
}

TokenizerConfig TokenizerConfig::from_config(const Config& config, Modality modality) {
    TokenizerConfig cfg = defaults(modality);

    cfg.num_embeddings  = config.get<TokenId>("num_embeddings", cfg.num_embeddings);
    cfg.padding_idx     = config.get<TokenId>("padding_idx", cfg.padding_idx);
    cfg.input_word      = config.get<bool>("input_word", cfg.input_word);
    cfg.window_size     = config.get<size_t>("window_size", cfg.window_size);
    cfg.window_height   = config.get<size_t>("window_height", cfg.window_height);
    cfg.window_width    = config.get<size_t>("window_width", cfg.window_width);
    cfg.stride          = config.get<size_t>("stride", cfg.stride);
    cfg.padding_value   = config.get<double>("padding_value", cfg.padding_value);
    cfg.random_seed     = config.get<uint64_t>("random_seed", cfg.random_seed);
    cfg.ngrams          = config.get<std::vector<size_t>>("ngrams", cfg.ngrams);
    cfg.skipngrams      = config.get<std::vector<size_t>>("skipngrams", cfg.skipngrams);
    cfg.max_positional  = config.get<Position>("max_positional", cfg.max_positional);
    cfg.language        = config.get<std::string>("language", cfg.language);
    cfg.lsh_feature_dim = config.get<size_t>("lsh_feature_dim", cfg.lsh_feature_dim);
    cfg.parallel_batch  = config.get<bool>("parallel_batch", cfg.parallel_batch);
    cfg.num_threads     = config.get<size_t>("num_threads", cfg.num_threads);

    SpectrogramParams& sp = cfg.spectrogram;
    sp.sampling_rate     = config.get<size_t>("sampling_rate", sp.sampling_rate);
    sp.n_fft             = config.get<size_t>("n_fft", sp.n_fft);
    sp.hop_length        = config.get<size_t>("hop_length", sp.hop_length);
    sp.silence_threshold = config.get<double>("silence_threshold", sp.silence_threshold);
    sp.silence_offset    = config.get<size_t>("silence_offset", sp.silence_offset);

    cfg.validate();
    LOG_DEBUG("Tokenizer config for ", to_string(modality), ": num_embeddings=", cfg.num_embeddings,
              " padding_idx=", cfg.padding_idx, " seed=", cfg.random_seed);
    return cfg;
}

void TokenizerConfig::validate() const {
    // Range checks on num_embeddings and padding_idx
    VocabularyBounds bounds(num_embeddings, padding_idx);
    (void)bounds;

    switch (modality) {
        case Modality::Ngram:
        case Modality::LshNgram:
            HASHTOK_CHECK_CONFIG(!ngrams.empty() || !skipngrams.empty(),
                                 "At least one n-gram or skip-gram size is required");
            for (size_t n : ngrams) HASHTOK_CHECK_CONFIG(n >= 1, "ngrams sizes must be at least 1");
            for (size_t k : skipngrams) HASHTOK_CHECK_CONFIG(k >= 1, "skipngrams sizes must be at least 1");
            if (modality == Modality::LshNgram) {
                HASHTOK_CHECK_CONFIG(lsh_feature_dim >= 1, "lsh_feature_dim must be at least 1");
            }
            break;
        case Modality::PositionalRough:
            if (!is_supported_language(language)) {
                throw UnsupportedLanguageError(language, __func__);
            }
            HASHTOK_CHECK_CONFIG(max_positional >= 1, "max_positional must be at least 1");
            break;
        case Modality::PositionalPrecise:
            HASHTOK_CHECK_CONFIG(max_positional >= 1, "max_positional must be at least 1");
            break;
        case Modality::Signal:
        case Modality::SignalDerivative:
            HASHTOK_CHECK_CONFIG(window_size >= 1, "window_size must be at least 1");
            HASHTOK_CHECK_CONFIG(stride >= 1, "stride must be at least 1");
            break;
        case Modality::Image:
            HASHTOK_CHECK_CONFIG(window_height >= 1 && window_width >= 1,
                                 "window_height and window_width must be at least 1");
            HASHTOK_CHECK_CONFIG(stride >= 1, "stride must be at least 1");
            break;
        case Modality::Spectrogram:
            HASHTOK_CHECK_CONFIG(window_size >= 1, "window_size must be at least 1");
            HASHTOK_CHECK_CONFIG(stride >= 1, "stride must be at least 1");
            HASHTOK_CHECK_CONFIG(spectrogram.n_fft >= 2, "n_fft must be at least 2");
            HASHTOK_CHECK_CONFIG(spectrogram.hop_length >= 1, "hop_length must be at least 1");
            HASHTOK_CHECK_CONFIG(spectrogram.sampling_rate >= 1, "sampling_rate must be at least 1");
            break;
        case Modality::Word:
        case Modality::Character:
            break;
    }
}

void init_config(const std::string& config_file) {
    Config& config = Config::getInstance();

    // Log level from the environment applies before the file is read
    LogLevel level = LogLevel::INFO;
    const char* log_level_env = std::getenv("HASHTOK_LOG_LEVEL");
    if (log_level_env && parse_log_level(log_level_env, level)) {
        set_log_level(level);
    }

    config.load(config_file);

    const std::string level_name = config.get<std::string>("log_level");
    if (!level_name.empty()) {
        if (parse_log_level(level_name, level)) {
            set_log_level(level);
        } else {
            LOG_WARN("Unknown log level '", level_name, "', keeping current level");
        }
    }

    const std::string log_file = config.get<std::string>("log_file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }
}

} // namespace hashtok
