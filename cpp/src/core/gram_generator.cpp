#include "hashtok/gram_generator.hpp"
#include "hashtok/error.hpp"
#include "hashtok/util/utf8.hpp"

#include <algorithm>
#include <iterator>

namespace hashtok {

GramGenerator::GramGenerator(std::vector<size_t> ngram_sizes, std::vector<size_t> skip_sizes)
    : ngram_sizes_(std::move(ngram_sizes)), skip_sizes_(std::move(skip_sizes)) {
    HASHTOK_CHECK_CONFIG(std::none_of(ngram_sizes_.begin(), ngram_sizes_.end(),
                                      [](size_t n) { return n == 0; }),
                         "n-gram sizes must be at least 1");
    HASHTOK_CHECK_CONFIG(std::none_of(skip_sizes_.begin(), skip_sizes_.end(),
                                      [](size_t k) { return k == 0; }),
                         "skip-gram sizes must be at least 1");
}

std::vector<std::string> GramGenerator::ngrams(std::string_view word, size_t n) {
    std::vector<std::string> result;
    if (n == 0) return result;

    const std::vector<uint32_t> cps = util::decode_utf8(word);
    if (cps.size() < n) return result;

    result.reserve(cps.size() - n + 1);
    for (size_t i = 0; i + n <= cps.size(); ++i) {
        result.push_back(util::encode_range(cps, i, i + n));
    }
    return result;
}

std::vector<std::string> GramGenerator::skipgrams(std::string_view word, size_t k) {
    std::vector<std::string> result;
    if (k == 0) return result;

    const std::vector<uint32_t> cps = util::decode_utf8(word);
    for (size_t offset = 0; offset < k && offset < cps.size(); ++offset) {
        std::string gram;
        for (size_t i = offset; i < cps.size(); i += k) {
            gram += util::encode_utf8(cps[i]);
        }
        result.push_back(std::move(gram));
    }
    return result;
}

std::vector<std::string> GramGenerator::grams(std::string_view word) const {
    std::vector<std::string> result;
    for (size_t n : ngram_sizes_) {
        auto g = ngrams(word, n);
        result.insert(result.end(), std::make_move_iterator(g.begin()), std::make_move_iterator(g.end()));
    }
    for (size_t k : skip_sizes_) {
        auto g = skipgrams(word, k);
        result.insert(result.end(), std::make_move_iterator(g.begin()), std::make_move_iterator(g.end()));
    }
    return result;
}

} // namespace hashtok
