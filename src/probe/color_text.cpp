#include "probe/color_text.hpp"

namespace {

bool isColorMarker(std::string_view text, std::size_t index) {
    return text[index] == '^' && index + 1 < text.size() && text[index + 1] >= '0' && text[index + 1] <= '9';
}

} // namespace

namespace q2browse::probe {

std::vector<TextSegment> SegmentColorCodes(std::string_view text) {
    std::vector<TextSegment> segments;
    TextSegment current;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (isColorMarker(text, i)) {
            if (!current.text.empty()) {
                segments.push_back(std::move(current));
            }
            current = TextSegment{};
            current.color = text[i + 1] - '0';
            ++i;
            continue;
        }
        current.text.push_back(text[i]);
    }

    if (!current.text.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

std::string StripColorCodes(std::string_view text) {
    std::string plain;
    plain.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (isColorMarker(text, i)) {
            ++i;
            continue;
        }
        plain.push_back(text[i]);
    }
    return plain;
}

} // namespace q2browse::probe
