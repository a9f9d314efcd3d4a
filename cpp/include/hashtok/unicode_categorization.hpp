#pragma once

#include <cstddef>
#include <cstdint>

namespace hashtok {

// Coarse codepoint classes used by the word and syllable segmenters
enum class CharClass : uint8_t {
    Control = 0,
    Space,
    Letter,
    Digit,
    Mark,         // combining marks, attach to the preceding letter
    Punctuation,
    Symbol,
    Format,       // zero-width joiners and similar, dropped between words
};

/**
 * Unicode categorization for segmentation.
 * Ranges not listed in the table fall back to Letter, which keeps
 * unlisted scripts inside words.
 */
class UnicodeCategorizer {
public:
    static CharClass categorize(uint32_t codepoint) noexcept;

    static bool is_word_char(uint32_t codepoint) noexcept {
        CharClass c = categorize(codepoint);
        return c == CharClass::Letter || c == CharClass::Digit || c == CharClass::Mark;
    }

    // Thai script block
    static constexpr bool is_thai(uint32_t codepoint) noexcept {
        return codepoint >= 0x0E00 && codepoint <= 0x0E7F;
    }

private:
    struct UnicodeBlock {
        uint32_t start;
        uint32_t end;
        CharClass cls;
    };

    // Sorted, non-overlapping
    static constexpr UnicodeBlock unicode_blocks[] = {
        {0x0000, 0x0008, CharClass::Control},
        {0x0009, 0x000D, CharClass::Space},
        {0x000E, 0x001F, CharClass::Control},
        {0x0020, 0x0020, CharClass::Space},
        {0x0021, 0x002F, CharClass::Punctuation},
        {0x0030, 0x0039, CharClass::Digit},
        {0x003A, 0x0040, CharClass::Punctuation},
        {0x0041, 0x005A, CharClass::Letter},
        {0x005B, 0x0060, CharClass::Punctuation},
        {0x0061, 0x007A, CharClass::Letter},
        {0x007B, 0x007E, CharClass::Punctuation},
        {0x007F, 0x009F, CharClass::Control},
        {0x00A0, 0x00A0, CharClass::Space},
        {0x00A1, 0x00BF, CharClass::Punctuation},
        {0x00C0, 0x00D6, CharClass::Letter},
        {0x00D7, 0x00D7, CharClass::Symbol},
        {0x00D8, 0x00F6, CharClass::Letter},
        {0x00F7, 0x00F7, CharClass::Symbol},
        {0x00F8, 0x02FF, CharClass::Letter},
        {0x0300, 0x036F, CharClass::Mark},
        {0x0370, 0x0482, CharClass::Letter},
        {0x0483, 0x0489, CharClass::Mark},
        {0x048A, 0x058F, CharClass::Letter},
        {0x0590, 0x05CF, CharClass::Mark},
        {0x05D0, 0x05FF, CharClass::Letter},
        {0x0600, 0x060F, CharClass::Punctuation},
        {0x0610, 0x061A, CharClass::Mark},
        {0x061B, 0x061F, CharClass::Punctuation},
        {0x0620, 0x064A, CharClass::Letter},
        {0x064B, 0x065F, CharClass::Mark},
        {0x0660, 0x0669, CharClass::Digit},
        {0x066A, 0x066D, CharClass::Punctuation},
        {0x066E, 0x06FF, CharClass::Letter},
        {0x0900, 0x0963, CharClass::Letter},
        {0x0964, 0x0965, CharClass::Punctuation},
        {0x0966, 0x096F, CharClass::Digit},
        {0x0970, 0x097F, CharClass::Letter},
        {0x0E01, 0x0E30, CharClass::Letter},
        {0x0E31, 0x0E31, CharClass::Mark},
        {0x0E32, 0x0E33, CharClass::Letter},
        {0x0E34, 0x0E3A, CharClass::Mark},
        {0x0E3F, 0x0E3F, CharClass::Symbol},
        {0x0E40, 0x0E46, CharClass::Letter},
        {0x0E47, 0x0E4E, CharClass::Mark},
        {0x0E4F, 0x0E4F, CharClass::Punctuation},
        {0x0E50, 0x0E59, CharClass::Digit},
        {0x0E5A, 0x0E5B, CharClass::Punctuation},
        {0x1680, 0x1680, CharClass::Space},
        {0x2000, 0x200A, CharClass::Space},
        {0x200B, 0x200F, CharClass::Format},
        {0x2010, 0x2027, CharClass::Punctuation},
        {0x2028, 0x2029, CharClass::Space},
        {0x202A, 0x202E, CharClass::Format},
        {0x202F, 0x202F, CharClass::Space},
        {0x2030, 0x205E, CharClass::Punctuation},
        {0x205F, 0x205F, CharClass::Space},
        {0x2060, 0x206F, CharClass::Format},
        {0x20A0, 0x20CF, CharClass::Symbol},
        {0x20D0, 0x20FF, CharClass::Mark},
        {0x2190, 0x2BFF, CharClass::Symbol},
        {0x3000, 0x3000, CharClass::Space},
        {0x3001, 0x3003, CharClass::Punctuation},
        {0x3008, 0x3011, CharClass::Punctuation},
        {0xD800, 0xDFFF, CharClass::Control},
        {0xE000, 0xF8FF, CharClass::Symbol},
        {0xFE00, 0xFE0F, CharClass::Mark},
        {0xFEFF, 0xFEFF, CharClass::Format},
        {0xFF01, 0xFF0F, CharClass::Punctuation},
        {0xFF10, 0xFF19, CharClass::Digit},
        {0xFFFD, 0xFFFD, CharClass::Symbol},
        {0x1F000, 0x1FAFF, CharClass::Symbol},
    };

    static constexpr size_t num_unicode_blocks = sizeof(unicode_blocks) / sizeof(unicode_blocks[0]);
};

} // namespace hashtok
