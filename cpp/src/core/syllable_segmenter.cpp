#include "hashtok/syllable_segmenter.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/util/utf8.hpp"

#include <algorithm>
#include <cstdint>

namespace hashtok {

namespace {

std::vector<std::string> slice(const std::vector<uint32_t>& cps, const std::vector<size_t>& bounds) {
    std::vector<std::string> syllables;
    syllables.reserve(bounds.size() - 1);
    for (size_t k = 0; k + 1 < bounds.size(); ++k) {
        syllables.push_back(util::encode_range(cps, bounds[k], bounds[k + 1]));
    }
    return syllables;
}

// =============================================================================
// English
// =============================================================================

uint32_t ascii_lower(uint32_t cp) {
    return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
}

bool is_plain_vowel(uint32_t cp) {
    switch (ascii_lower(cp)) {
        case 'a': case 'e': case 'i': case 'o': case 'u': return true;
        default: return false;
    }
}

bool is_onset_digraph(uint32_t a, uint32_t b) {
    if (ascii_lower(b) != 'h') return false;
    switch (ascii_lower(a)) {
        case 't': case 's': case 'c': case 'p': case 'w': return true;
        default: return false;
    }
}

struct Nucleus {
    size_t begin;
    size_t end;
};

// =============================================================================
// Thai
// =============================================================================

bool th_consonant(uint32_t cp)        { return cp >= 0x0E01 && cp <= 0x0E2E; }
bool th_leading_vowel(uint32_t cp)    { return cp >= 0x0E40 && cp <= 0x0E44; }
bool th_following_vowel(uint32_t cp)  { return cp == 0x0E30 || cp == 0x0E32 || cp == 0x0E33 || cp == 0x0E45; }
bool th_above_below_vowel(uint32_t cp){ return cp == 0x0E31 || (cp >= 0x0E34 && cp <= 0x0E3A) || cp == 0x0E47; }
bool th_tone_mark(uint32_t cp)        { return cp >= 0x0E48 && cp <= 0x0E4B; }

// Characters written on or after a consonant that make it a syllable initial
bool attaches_to_consonant(uint32_t cp) {
    return th_following_vowel(cp) || th_above_below_vowel(cp) || th_tone_mark(cp);
}

struct ThaiSyllableState {
    bool lead = false;      // opened by a leading vowel
    size_t initials = 0;    // initial consonants seen
    bool vowel = false;     // written vowel seen
    bool final_c = false;   // final consonant seen
    bool closed = false;    // nothing more may attach
};

} // anonymous namespace

std::vector<std::string> EnglishSyllableSegmenter::segment(std::string_view word) const {
    const std::vector<uint32_t> cps = util::decode_utf8(word);
    const size_t n = cps.size();
    if (n == 0) return {};

    // y is a vowel unless it starts the word or follows another vowel
    std::vector<bool> vowel(n, false);
    for (size_t i = 0; i < n; ++i) {
        vowel[i] = is_plain_vowel(cps[i]) ||
                   (ascii_lower(cps[i]) == 'y' && i > 0 && !vowel[i - 1]);
    }

    std::vector<Nucleus> nuclei;
    for (size_t i = 0; i < n;) {
        if (!vowel[i]) { ++i; continue; }
        size_t begin = i;
        while (i < n && vowel[i]) ++i;
        nuclei.push_back({begin, i});
    }

    bool consonant_le = false;
    if (nuclei.size() > 1) {
        const Nucleus& last = nuclei.back();
        const bool final_e = last.begin == n - 1 && ascii_lower(cps[n - 1]) == 'e';
        consonant_le = final_e && n >= 3 && ascii_lower(cps[n - 2]) == 'l' && !vowel[n - 3];
        if (final_e && !consonant_le) {
            nuclei.pop_back();  // silent e
        }
    }

    if (nuclei.size() <= 1) {
        return {util::encode_range(cps, 0, n)};
    }

    std::vector<size_t> bounds{0};
    for (size_t k = 0; k + 1 < nuclei.size(); ++k) {
        const size_t ea = nuclei[k].end;
        const size_t sb = nuclei[k + 1].begin;
        const size_t consonants = sb - ea;

        size_t cut;
        if (consonant_le && k + 2 == nuclei.size()) {
            cut = n - 3;
        } else if (consonants <= 1) {
            cut = ea;
        } else if (is_onset_digraph(cps[sb - 2], cps[sb - 1])) {
            cut = sb - 2;
        } else {
            cut = ea + 1;
        }

        if (cut > bounds.back() && cut < n) {
            bounds.push_back(cut);
        }
    }
    bounds.push_back(n);

    return slice(cps, bounds);
}

std::vector<std::string> ThaiSyllableSegmenter::segment(std::string_view word) const {
    const std::vector<uint32_t> cps = util::decode_utf8(word);
    const size_t n = cps.size();
    if (n == 0) return {};

    std::vector<size_t> bounds{0};
    ThaiSyllableState st;
    bool empty = true;

    auto open = [&](size_t i) {
        if (!empty) bounds.push_back(i);
        st = ThaiSyllableState{};
        empty = false;
    };

    for (size_t i = 0; i < n; ++i) {
        const uint32_t cp = cps[i];
        const uint32_t next = i + 1 < n ? cps[i + 1] : 0;

        if (th_leading_vowel(cp)) {
            open(i);
            st.lead = true;
        } else if (th_consonant(cp)) {
            if (empty || st.closed) {
                open(i);
                st.initials = 1;
            } else if (st.lead && st.initials == 0) {
                st.initials = 1;
            } else if (st.initials == 1 && !st.vowel && !st.final_c && attaches_to_consonant(next)) {
                st.initials = 2;  // cluster
            } else if (st.vowel || st.lead) {
                if (!st.final_c && !attaches_to_consonant(next)) {
                    st.final_c = true;
                } else {
                    open(i);
                    st.initials = 1;
                }
            } else if (st.initials == 1 && !attaches_to_consonant(next)) {
                // inherent vowel between initial and final
                st.final_c = true;
                st.closed = true;
            } else {
                open(i);
                st.initials = 1;
            }
        } else if (th_following_vowel(cp)) {
            if (empty) open(i);
            st.vowel = true;
            if (cp == 0x0E30 || cp == 0x0E33) st.closed = true;
        } else if (th_above_below_vowel(cp)) {
            if (empty) open(i);
            st.vowel = true;
        } else if (empty) {
            open(i);
        }
    }
    bounds.push_back(n);

    return slice(cps, bounds);
}

const std::vector<std::string>& supported_languages() {
    static const std::vector<std::string> languages = {"en", "th"};
    return languages;
}

bool is_supported_language(std::string_view language) {
    const auto& languages = supported_languages();
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

std::shared_ptr<const SyllableSegmenter> make_syllable_segmenter(const std::string& language) {
    if (language == "en") {
        return std::make_shared<EnglishSyllableSegmenter>();
    }
    if (language == "th") {
        return std::make_shared<ThaiSyllableSegmenter>();
    }
    LOG_ERROR("No syllable segmenter for language '", language, "'");
    throw UnsupportedLanguageError(language, __func__);
}

} // namespace hashtok
