#pragma once

#include <stdexcept>
#include <string>

namespace hashtok {

/**
 * Error reporting for the tokenization engine.
 *
 * Two failure classes exist:
 *  - configuration errors, raised while constructing a component from
 *    parameters that can never work;
 *  - malformed input errors, raised at call time when a particular input
 *    cannot be tokenized under a valid configuration.
 * Both carry the throwing function as context.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Construction-time
    CONFIGURATION_ERROR = 100,
    UNSUPPORTED_LANGUAGE = 101,

    // Call-time
    MALFORMED_INPUT = 200,

    INTERNAL_ERROR = 500
};

class HashtokException : public std::runtime_error {
public:
    explicit HashtokException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "hashtok error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class ConfigurationError : public HashtokException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : HashtokException(ErrorCode::CONFIGURATION_ERROR, message, context, suggestion) {}

protected:
    ConfigurationError(ErrorCode code, const std::string& message,
                       const std::string& context, const std::string& suggestion)
        : HashtokException(code, message, context, suggestion) {}
};

class UnsupportedLanguageError : public ConfigurationError {
public:
    explicit UnsupportedLanguageError(const std::string& language,
                                      const std::string& context = "")
        : ConfigurationError(ErrorCode::UNSUPPORTED_LANGUAGE,
                             "Unsupported language: '" + language + "'",
                             context, "Use one of: en, th") {}
};

class MalformedInputError : public HashtokException {
public:
    explicit MalformedInputError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : HashtokException(ErrorCode::MALFORMED_INPUT, message, context, suggestion) {}
};

// Macros for common error checking
#define HASHTOK_CHECK_CONFIG(condition, message) \
    do { if (!(condition)) throw hashtok::ConfigurationError((message), __func__); } while (0)

#define HASHTOK_CHECK_INPUT(condition, message) \
    do { if (!(condition)) throw hashtok::MalformedInputError((message), __func__); } while (0)

#define HASHTOK_THROW(code, message) \
    throw hashtok::HashtokException(code, message, __func__)

} // namespace hashtok
