#include "hashtok/util/utf8.hpp"

namespace hashtok::util {

namespace {

constexpr uint32_t kReplacement = 0xFFFD;

// Sequence length announced by a lead byte, 0 for continuation or invalid bytes
size_t sequence_length(uint8_t lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

constexpr uint32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};

} // anonymous namespace

// Token bytes are hashed as given, so no BOM stripping happens here.
// A malformed sequence yields one U+FFFD and decoding resumes at the next byte.
std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    const size_t size = data.size();

    size_t i = 0;
    while (i < size) {
        const size_t len = sequence_length(bytes[i]);
        if (len == 1) {
            codepoints.push_back(bytes[i++]);
            continue;
        }
        if (len == 0 || i + len > size) {
            codepoints.push_back(kReplacement);
            ++i;
            continue;
        }

        uint32_t cp = bytes[i] & (0x7F >> len);
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (bytes[i + k] & 0x3F);
        }

        if (!valid) {
            codepoints.push_back(kReplacement);
            ++i;
            continue;
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if (cp < kMinForLength[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = kReplacement;
        }
        codepoints.push_back(cp);
        i += len;
    }

    return codepoints;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::vector<std::string> split_chars(std::string_view data) {
    std::vector<uint32_t> codepoints = decode_utf8(data);
    std::vector<std::string> chars;
    chars.reserve(codepoints.size());
    for (uint32_t cp : codepoints) {
        chars.push_back(encode_utf8(cp));
    }
    return chars;
}

std::string encode_range(const std::vector<uint32_t>& codepoints, size_t begin, size_t end) {
    std::string result;
    for (size_t i = begin; i < end && i < codepoints.size(); ++i) {
        result += encode_utf8(codepoints[i]);
    }
    return result;
}

} // namespace hashtok::util
