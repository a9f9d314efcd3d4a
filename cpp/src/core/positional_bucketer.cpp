#include "hashtok/positional_bucketer.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/util/utf8.hpp"

#include <algorithm>

namespace hashtok {

PositionalBucketer::PositionalBucketer(PositionPolicy policy, Position max_positional,
                                       std::shared_ptr<const SyllableSegmenter> segmenter)
    : policy_(policy), max_positional_(max_positional), segmenter_(std::move(segmenter)) {
    HASHTOK_CHECK_CONFIG(max_positional_ >= 1, "max_positional must be at least 1");
}

PositionalBucketer PositionalBucketer::precise(Position max_positional) {
    return PositionalBucketer(PositionPolicy::Precise, max_positional, nullptr);
}

PositionalBucketer PositionalBucketer::rough(Position max_positional, const std::string& language) {
    auto segmenter = make_syllable_segmenter(language);
    LOG_DEBUG("Rough positional bucketing, language=", language, " max_positional=", max_positional);
    return PositionalBucketer(PositionPolicy::Rough, max_positional, std::move(segmenter));
}

Position PositionalBucketer::clamp(size_t index) const noexcept {
    return static_cast<Position>(std::min(index, static_cast<size_t>(max_positional_ - 1)));
}

std::vector<Position> PositionalBucketer::positions(const std::vector<std::string>& chars) const {
    std::vector<Position> result;
    result.reserve(chars.size());

    if (policy_ == PositionPolicy::Precise) {
        for (size_t i = 0; i < chars.size(); ++i) {
            result.push_back(clamp(i));
        }
        return result;
    }

    std::string word;
    for (const auto& c : chars) word += c;

    const std::vector<std::string> syllables = segmenter_->segment(word);
    for (size_t j = 0; j < syllables.size(); ++j) {
        const size_t length = util::decode_utf8(syllables[j]).size();
        result.insert(result.end(), length, clamp(j));
    }

    if (result.size() != chars.size()) {
        HASHTOK_THROW(ErrorCode::INTERNAL_ERROR,
                      "Syllables of '" + word + "' do not cover its " +
                      std::to_string(chars.size()) + " characters");
    }
    return result;
}

PositionedChars PositionalBucketer::positionize(std::string_view word) const {
    PositionedChars out;
    out.chars = util::split_chars(word);
    out.positions = positions(out.chars);
    return out;
}

} // namespace hashtok
