#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hashtok {

/**
 * Sub-word grams of a single word, counted in codepoints.
 *
 * For a configured list of n-gram sizes and skip sizes, grams() returns all
 * n-grams for each n in configured order, followed by all skip-grams for
 * each k in configured order.
 */
class GramGenerator {
public:
    GramGenerator() = default;

    // Throws ConfigurationError if any size is zero
    GramGenerator(std::vector<size_t> ngram_sizes, std::vector<size_t> skip_sizes);

    // Contiguous substrings of n codepoints; empty if the word is shorter than n
    static std::vector<std::string> ngrams(std::string_view word, size_t n);

    // For each offset o in [0, k): the characters at o, o + k, o + 2k, ...
    // "hello", k = 2 -> {"hlo", "el"}
    static std::vector<std::string> skipgrams(std::string_view word, size_t k);

    std::vector<std::string> grams(std::string_view word) const;

    const std::vector<size_t>& ngram_sizes() const noexcept { return ngram_sizes_; }
    const std::vector<size_t>& skip_sizes() const noexcept { return skip_sizes_; }

private:
    std::vector<size_t> ngram_sizes_;
    std::vector<size_t> skip_sizes_;
};

} // namespace hashtok
