#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace q2browse::probe {

constexpr int DEFAULT_COLOR = -1;

struct TextSegment {
    std::string text;
    // 0-9 as selected by the preceding "^N" marker, DEFAULT_COLOR before any marker.
    int color = DEFAULT_COLOR;

    bool operator==(const TextSegment &other) const {
        return text == other.text && color == other.color;
    }
};

// Splits on "^<digit>" markers. A caret not followed by a digit is literal
// text. Empty runs between consecutive markers are dropped.
std::vector<TextSegment> SegmentColorCodes(std::string_view text);

std::string StripColorCodes(std::string_view text);

} // namespace q2browse::probe
