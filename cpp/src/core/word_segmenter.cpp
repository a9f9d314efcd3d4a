#include "hashtok/word_segmenter.hpp"
#include "hashtok/unicode_categorization.hpp"
#include "hashtok/util/utf8.hpp"

namespace hashtok {

namespace {

bool is_digit(uint32_t cp) {
    return UnicodeCategorizer::categorize(cp) == CharClass::Digit;
}

bool is_letter(uint32_t cp) {
    return UnicodeCategorizer::categorize(cp) == CharClass::Letter;
}

// Punctuation that stays inside a word when flanked appropriately
bool joins_word(const std::vector<uint32_t>& cps, size_t i) {
    if (i == 0 || i + 1 >= cps.size()) return false;
    const uint32_t prev = cps[i - 1];
    const uint32_t next = cps[i + 1];
    switch (cps[i]) {
        case '.': case ',':
            return is_digit(prev) && is_digit(next);
        case '\'': case 0x2019:
            return is_letter(prev) && is_letter(next);
        default:
            return false;
    }
}

} // anonymous namespace

std::vector<std::string> WordSegmenter::segment(std::string_view text) const {
    const std::vector<uint32_t> cps = util::decode_utf8(text);

    std::vector<std::string> words;
    size_t start = 0;
    bool in_word = false;

    auto flush = [&](size_t end) {
        if (in_word) {
            words.push_back(util::encode_range(cps, start, end));
            in_word = false;
        }
    };

    for (size_t i = 0; i < cps.size(); ++i) {
        const uint32_t cp = cps[i];
        switch (UnicodeCategorizer::categorize(cp)) {
            case CharClass::Letter:
            case CharClass::Digit:
            case CharClass::Mark:
                if (!in_word) {
                    start = i;
                    in_word = true;
                }
                break;
            case CharClass::Punctuation:
            case CharClass::Symbol:
                if (in_word && joins_word(cps, i)) break;
                flush(i);
                words.push_back(util::encode_utf8(cp));
                break;
            case CharClass::Space:
            case CharClass::Control:
            case CharClass::Format:
                flush(i);
                break;
        }
    }
    flush(cps.size());

    return words;
}

} // namespace hashtok
