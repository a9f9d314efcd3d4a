// =============================================================================
// hashtok CLI - tokenize stdin line by line
// =============================================================================
//
// Usage:
//   hashtok <modality> [--config FILE] [--key=value ...]
//
// Modalities:
//   word, ngram, lsh-ngram, char, positional-rough, positional-precise,
//   signal, signal-derivative, image, spectrogram
//
// Input, one item per line:
//   text modalities     raw UTF-8 text
//   signal modalities   whitespace-separated numbers
//   image               rows of numbers separated by ';'
//
// Output, one line per input line:
//   word, signal        ids separated by spaces
//   ngram, char         words separated by " | ", ids by spaces
//   positional-*        id@position, words separated by " | "
//   image, spectrogram  grid rows separated by " ; "
//
// Exit status: 0 success, 1 configuration error, 2 malformed input.
//
// Examples:
//   echo "hello world" | hashtok word --num_embeddings=1000
//   hashtok signal --config tokenizer.conf < samples.txt
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "hashtok/hashtok.hpp"

#define HASHTOK_VERSION_STRING "1.0.0"

namespace hashtok::cli {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_CONFIGURATION = 1,
    EXIT_MALFORMED_INPUT = 2,
};

// =============================================================================
// Input parsing
// =============================================================================

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

Signal parse_numbers(const std::string& text, size_t line_no) {
    Signal values;
    std::istringstream ss(text);
    std::string field;
    while (ss >> field) {
        try {
            size_t used = 0;
            values.push_back(std::stod(field, &used));
            if (used != field.size()) throw std::invalid_argument(field);
        } catch (const std::exception&) {
            throw MalformedInputError("Line " + std::to_string(line_no) + ": '" + field + "' is not a number",
                                      "parse_numbers");
        }
    }
    return values;
}

Image parse_image(const std::string& text, size_t line_no) {
    std::vector<Signal> rows;
    std::stringstream ss(text);
    std::string row;
    while (std::getline(ss, row, ';')) {
        Signal values = parse_numbers(row, line_no);
        if (!values.empty()) rows.push_back(std::move(values));
    }

    HASHTOK_CHECK_INPUT(!rows.empty(), "Line " + std::to_string(line_no) + ": empty image");
    const size_t width = rows.front().size();

    Image image(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(width));
    for (size_t r = 0; r < rows.size(); ++r) {
        HASHTOK_CHECK_INPUT(rows[r].size() == width,
                            "Line " + std::to_string(line_no) + ": row " + std::to_string(r) +
                            " has " + std::to_string(rows[r].size()) + " values, expected " +
                            std::to_string(width));
        for (size_t c = 0; c < width; ++c) {
            image(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }
    return image;
}

std::vector<Signal> parse_signals(const std::vector<std::string>& lines) {
    std::vector<Signal> signals;
    signals.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        signals.push_back(parse_numbers(lines[i], i + 1));
    }
    return signals;
}

// =============================================================================
// Output formatting
// =============================================================================

void print_ids(std::ostream& out, const std::vector<TokenId>& ids) {
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out << ' ';
        out << ids[i];
    }
}

void print_nested(std::ostream& out, const std::vector<std::vector<TokenId>>& ids, const char* sep) {
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out << sep;
        print_ids(out, ids[i]);
    }
}

void print_positioned(std::ostream& out, const std::vector<PositionedIds>& words) {
    for (size_t w = 0; w < words.size(); ++w) {
        if (w) out << " | ";
        for (size_t i = 0; i < words[w].ids.size(); ++i) {
            if (i) out << ' ';
            out << words[w].ids[i] << '@' << words[w].positions[i];
        }
    }
}

// =============================================================================
// Modality runners
// =============================================================================

void run(const TokenizerConfig& config, const std::vector<std::string>& lines, std::ostream& out) {
    switch (config.modality) {
        case Modality::Word: {
            WordTokenizer tokenizer(config);
            for (const auto& ids : tokenizer(lines)) {
                print_ids(out, ids);
                out << '\n';
            }
            break;
        }
        case Modality::Ngram:
        case Modality::LshNgram: {
            NgramTokenizer tokenizer(config, config.modality == Modality::LshNgram ? GramHashing::Lsh
                                                                                  : GramHashing::Crypto);
            for (const auto& words : tokenizer(lines)) {
                print_nested(out, words, " | ");
                out << '\n';
            }
            break;
        }
        case Modality::Character: {
            CharacterTokenizer tokenizer(config);
            for (const auto& words : tokenizer(lines)) {
                print_nested(out, words, " | ");
                out << '\n';
            }
            break;
        }
        case Modality::PositionalRough:
        case Modality::PositionalPrecise: {
            PositionalCharacterTokenizer tokenizer(
                config, config.modality == Modality::PositionalRough ? PositionPolicy::Rough
                                                                     : PositionPolicy::Precise);
            for (const auto& words : tokenizer(lines)) {
                print_positioned(out, words);
                out << '\n';
            }
            break;
        }
        case Modality::Signal:
        case Modality::SignalDerivative: {
            SignalTokenizer tokenizer(config, config.modality == Modality::SignalDerivative
                                                  ? SignalTransform::Derivative
                                                  : SignalTransform::Raw);
            for (const auto& ids : tokenizer(parse_signals(lines))) {
                print_ids(out, ids);
                out << '\n';
            }
            break;
        }
        case Modality::Image: {
            ImageTokenizer tokenizer(config);
            std::vector<Image> images;
            images.reserve(lines.size());
            for (size_t i = 0; i < lines.size(); ++i) {
                images.push_back(parse_image(lines[i], i + 1));
            }
            for (const auto& grid : tokenizer(images)) {
                print_nested(out, grid, " ; ");
                out << '\n';
            }
            break;
        }
        case Modality::Spectrogram: {
            SpectrogramTokenizer tokenizer(config);
            for (const auto& grid : tokenizer(parse_signals(lines))) {
                print_nested(out, grid, " ; ");
                out << '\n';
            }
            break;
        }
    }
}

// =============================================================================
// Commands
// =============================================================================

int cmd_help() {
    std::cout << "hashtok - windowed feature-hashing tokenizer\n";
    std::cout << "Version " << HASHTOK_VERSION_STRING << "\n\n";
    std::cout << "Usage: hashtok <modality> [--config FILE] [--key=value ...]\n\n";
    std::cout << "Modalities:\n";
    for (Modality m : all_modalities()) {
        std::cout << "  " << to_string(m) << "\n";
    }
    std::cout << "\nKeys:\n ";
    for (const auto& key : config_keys()) {
        std::cout << ' ' << key;
    }
    std::cout << "\n\nEvery key may also be set as HASHTOK_<KEY> in the environment.\n";
    return EXIT_OK;
}

int cmd_version() {
    std::cout << "hashtok " << HASHTOK_VERSION_STRING << "\n";
    return EXIT_OK;
}

int cmd_tokenize(const std::string& modality_name, int argc, char* argv[]) {
    try {
        const Modality modality = parse_modality(modality_name);

        std::string config_file;
        std::vector<std::pair<std::string, std::string>> overrides;
        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg.rfind("--", 0) == 0 && arg.find('=') != std::string::npos) {
                const size_t eq = arg.find('=');
                overrides.emplace_back(arg.substr(2, eq - 2), arg.substr(eq + 1));
            } else {
                throw ConfigurationError("Unknown option: " + arg, "cmd_tokenize",
                                         "Run 'hashtok help' for usage");
            }
        }

        init_config(config_file);
        Config& config = Config::getInstance();
        for (const auto& [key, value] : overrides) {
            config.set_known(key, value);
        }

        const TokenizerConfig tokenizer_config = TokenizerConfig::from_config(config, modality);
        run(tokenizer_config, read_lines(std::cin), std::cout);
        std::cout.flush();
        return EXIT_OK;
    } catch (const ConfigurationError& e) {
        LOG_ERROR(e.what());
        return EXIT_CONFIGURATION;
    } catch (const MalformedInputError& e) {
        LOG_ERROR(e.what());
        return EXIT_MALFORMED_INPUT;
    } catch (const HashtokException& e) {
        LOG_ERROR(e.what());
        return EXIT_CONFIGURATION;
    }
}

}  // namespace hashtok::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        hashtok::cli::cmd_help();
        return hashtok::cli::EXIT_CONFIGURATION;
    }

    const char* cmd_name = argv[1];
    if (std::strcmp(cmd_name, "help") == 0 || std::strcmp(cmd_name, "--help") == 0) {
        return hashtok::cli::cmd_help();
    }
    if (std::strcmp(cmd_name, "version") == 0 || std::strcmp(cmd_name, "--version") == 0) {
        return hashtok::cli::cmd_version();
    }
    return hashtok::cli::cmd_tokenize(cmd_name, argc - 2, argv + 2);
}
