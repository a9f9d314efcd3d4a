#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hashtok {

/**
 * Splits one word into syllables. The concatenation of the returned
 * syllables is always the input word, byte for byte.
 */
class SyllableSegmenter {
public:
    virtual ~SyllableSegmenter() = default;

    virtual std::vector<std::string> segment(std::string_view word) const = 0;

    virtual std::string_view language() const noexcept = 0;
};

/**
 * Rule-based English syllabification over vowel nuclei:
 * V-CV for one intervening consonant, VC-CV for two or more, onset digraphs
 * (th, sh, ch, ph, wh) kept together, silent final e merged, consonant + le
 * kept as a final syllable.
 */
class EnglishSyllableSegmenter final : public SyllableSegmenter {
public:
    std::vector<std::string> segment(std::string_view word) const override;
    std::string_view language() const noexcept override { return "en"; }
};

/**
 * Rule-based Thai syllable grouping: leading vowels open a syllable, above,
 * below and following vowels and tone marks attach to the current one, and
 * at most one final consonant closes it.
 */
class ThaiSyllableSegmenter final : public SyllableSegmenter {
public:
    std::vector<std::string> segment(std::string_view word) const override;
    std::string_view language() const noexcept override { return "th"; }
};

// Closed set of languages with a syllable segmenter
const std::vector<std::string>& supported_languages();

bool is_supported_language(std::string_view language);

// Throws UnsupportedLanguageError for languages outside supported_languages()
std::shared_ptr<const SyllableSegmenter> make_syllable_segmenter(const std::string& language);

} // namespace hashtok
