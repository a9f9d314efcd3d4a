#pragma once

#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/signal_processing.hpp"
#include "hashtok/types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace hashtok {

// Every key the tokenizers understand; each may also be set through the
// environment as HASHTOK_<KEY> in upper case.
inline const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys = {
        "num_embeddings", "padding_idx", "input_word",
        "window_size", "window_height", "window_width", "stride", "padding_value",
        "random_seed", "ngrams", "skipngrams", "max_positional", "language",
        "lsh_feature_dim", "sampling_rate", "n_fft", "hop_length",
        "silence_threshold", "silence_offset", "parallel_batch", "num_threads",
        "log_level", "log_file",
    };
    return keys;
}

inline bool is_config_key(const std::string& key) {
    const auto& keys = config_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

/**
 * String key/value store: environment first, then an optional key = value
 * file, then explicit set() calls, each overriding the previous.
 */
class Config {
public:
    Config() = default;

    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Throws ConfigurationError if config_file is given but cannot be read
    void load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        load_from_env();
        if (!config_file.empty()) {
            load_from_file(config_file);
        }
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    /**
     * Typed lookup. Supports std::string, bool, integral types, double and
     * std::vector<size_t> (comma separated). Throws ConfigurationError when
     * the stored text does not parse as T.
     */
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        return parse<T>(key, it->second);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // set() restricted to config_keys(); a misspelled key is a ConfigurationError
    void set_known(const std::string& key, const std::string& value) {
        if (!is_config_key(key)) {
            throw ConfigurationError("Unknown configuration key '" + key + "'", "Config::set_known",
                                     "Run 'hashtok help' for the list of keys");
        }
        set(key, value);
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    [[noreturn]] static void bad_value(const std::string& key, const std::string& text, const char* expected) {
        throw ConfigurationError("Cannot parse '" + text + "' for key '" + key + "'",
                                 "Config::get", std::string("Expected ") + expected);
    }

    template<typename T>
    static T parse(const std::string& key, const std::string& text) {
        if constexpr (std::is_same_v<T, std::string>) {
            return text;
        } else if constexpr (std::is_same_v<T, bool>) {
            std::string val = text;
            std::transform(val.begin(), val.end(), val.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
            if (val == "false" || val == "0" || val == "no" || val == "off") return false;
            bad_value(key, text, "a boolean");
        } else if constexpr (std::is_integral_v<T>) {
            const char* begin = text.c_str();
            char* end = nullptr;
            errno = 0;
            if constexpr (std::is_unsigned_v<T>) {
                // strtoull accepts "-1" and wraps it
                if (text.find('-') != std::string::npos) {
                    bad_value(key, text, "a non-negative integer");
                }
                const unsigned long long v = std::strtoull(begin, &end, 10);
                if (text.empty() || *end != '\0' || errno == ERANGE) {
                    bad_value(key, text, "an integer");
                }
                if (v > std::numeric_limits<T>::max()) {
                    bad_value(key, text, "a smaller integer");
                }
                return static_cast<T>(v);
            } else {
                const long long v = std::strtoll(begin, &end, 10);
                if (text.empty() || *end != '\0' || errno == ERANGE) {
                    bad_value(key, text, "an integer");
                }
                if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
                    bad_value(key, text, "a smaller integer");
                }
                return static_cast<T>(v);
            }
        } else if constexpr (std::is_same_v<T, double>) {
            const char* begin = text.c_str();
            char* end = nullptr;
            const double v = std::strtod(begin, &end);
            if (text.empty() || *end != '\0') {
                bad_value(key, text, "a number");
            }
            return v;
        } else if constexpr (std::is_same_v<T, std::vector<size_t>>) {
            std::vector<size_t> items;
            size_t start = 0;
            while (start <= text.size()) {
                size_t comma = text.find(',', start);
                if (comma == std::string::npos) comma = text.size();
                const std::string item = trim(text.substr(start, comma - start));
                if (!item.empty()) {
                    items.push_back(parse<size_t>(key, item));
                }
                start = comma + 1;
            }
            return items;
        } else {
            static_assert(!sizeof(T), "Unsupported config value type");
        }
    }

    void load_from_env() {
        for (const auto& key : config_keys()) {
            std::string env_var = "HASHTOK_" + key;
            std::transform(env_var.begin(), env_var.end(), env_var.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            const char* env_value = std::getenv(env_var.c_str());
            if (env_value && *env_value) {
                values_[key] = env_value;
            }
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw ConfigurationError("Could not open config file: " + filename, "Config::load");
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring config line without '=': ", line);
                continue;
            }

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// =============================================================================
// Tokenizer configuration
// =============================================================================

enum class Modality {
    Word,
    Ngram,
    LshNgram,
    Character,
    PositionalRough,
    PositionalPrecise,
    Signal,
    SignalDerivative,
    Image,
    Spectrogram,
};

// Throws ConfigurationError for unknown names
Modality parse_modality(std::string_view name);
const char* to_string(Modality modality);
const std::vector<Modality>& all_modalities();

bool is_text_modality(Modality modality);

struct TokenizerConfig {
    Modality modality = Modality::Word;

    TokenId num_embeddings = 0;
    TokenId padding_idx = 0;
    bool input_word = false;

    // Signal and spectrogram windows; image windows use window_height/width
    size_t window_size = 1000;
    size_t window_height = 9;
    size_t window_width = 9;
    size_t stride = 100;
    double padding_value = 0.0;
    uint64_t random_seed = 0;

    std::vector<size_t> ngrams{3, 4, 5, 6};
    std::vector<size_t> skipngrams{2, 3};
    Position max_positional = 10;
    std::string language = "en";
    size_t lsh_feature_dim = 64;

    SpectrogramParams spectrogram;

    bool parallel_batch = true;
    size_t num_threads = 0;  // 0 = shared pool sized to the hardware

    // Defaults of the modality, with num_embeddings still unset
    static TokenizerConfig defaults(Modality modality);

    // Modality defaults overridden by the keys present in `config`; validated
    static TokenizerConfig from_config(const Config& config, Modality modality);

    // Throws ConfigurationError on the first unusable value
    void validate() const;
};

/**
 * Loads the global Config and applies its logging keys.
 * HASHTOK_LOG_LEVEL is honoured before the file is read.
 */
void init_config(const std::string& config_file = "");

} // namespace hashtok
