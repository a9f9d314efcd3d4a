#pragma once

#include "hashtok/syllable_segmenter.hpp"
#include "hashtok/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hashtok {

enum class PositionPolicy {
    Precise,  // position = character index
    Rough,    // position = syllable index
};

/**
 * Assigns every character of a word a position in [0, max_positional),
 * clamped at max_positional - 1.
 */
class PositionalBucketer {
public:
    // Throws ConfigurationError if max_positional < 1
    static PositionalBucketer precise(Position max_positional);

    // Throws ConfigurationError if max_positional < 1 or the language is unsupported
    static PositionalBucketer rough(Position max_positional, const std::string& language);

    // Positions parallel to `chars` (one codepoint per entry)
    std::vector<Position> positions(const std::vector<std::string>& chars) const;

    // Splits the word into characters and attaches their positions
    PositionedChars positionize(std::string_view word) const;

    PositionPolicy policy() const noexcept { return policy_; }
    Position max_positional() const noexcept { return max_positional_; }

private:
    PositionalBucketer(PositionPolicy policy, Position max_positional,
                       std::shared_ptr<const SyllableSegmenter> segmenter);

    Position clamp(size_t index) const noexcept;

    PositionPolicy policy_;
    Position max_positional_;
    std::shared_ptr<const SyllableSegmenter> segmenter_;  // Rough only
};

} // namespace hashtok
