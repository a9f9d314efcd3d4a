#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hashtok::util {

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Split a UTF-8 string into one string per codepoint
std::vector<std::string> split_chars(std::string_view data);

// Concatenate codepoints [begin, end) back into UTF-8
std::string encode_range(const std::vector<uint32_t>& codepoints, size_t begin, size_t end);

} // namespace hashtok::util
