#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hashtok {

/**
 * Word-level text segmentation.
 *
 * Runs of letters, digits and combining marks form words. Every punctuation
 * or symbol character is a token of its own, except a '.' or ',' between two
 * digits ("3.14", "1,000") and an apostrophe between two letters ("don't"),
 * which stay inside the word. Spaces, controls and format characters only
 * separate.
 */
class WordSegmenter {
public:
    std::vector<std::string> segment(std::string_view text) const;
};

} // namespace hashtok
