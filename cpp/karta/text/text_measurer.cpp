#include "karta/text/text_measurer.h"

#include <algorithm>
#include <vector>

namespace karta {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        const auto pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

} // namespace

TextStyle textStyleOf(const SceneObject& obj) {
    TextStyle style;
    style.fontSize = obj.fontSize;
    style.fontFamily = obj.fontFamily;
    style.fontWeight = obj.fontWeight;
    style.italic = obj.fontStyle == FontStyle::Italic;
    style.lineHeight = obj.lineHeight;
    return style;
}

std::size_t TextMeasurer::codePointCount(const std::string& utf8) {
    std::size_t count = 0;
    for (unsigned char c : utf8) {
        // Continuation bytes are 10xxxxxx.
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

float TextMeasurer::fallbackLineWidth(const std::string& line, float fontSize) {
    return static_cast<float>(codePointCount(line)) * fontSize * constants::kFallbackAdvanceEm;
}

TextDimensions TextMeasurer::measure(const std::string& text, const TextStyle& style) const {
    const std::vector<std::string> lines = splitLines(text);
    const float lineHeightPx = style.fontSize * style.lineHeight;

    float maxWidth = 0.0f;
    for (const std::string& raw : lines) {
        // An empty line still occupies one space.
        const std::string line = raw.empty() ? std::string(" ") : raw;
        std::optional<float> width;
        if (shaper_) {
            width = shaper_->shapedWidth(line, style);
        }
        maxWidth = std::max(maxWidth, width ? *width : fallbackLineWidth(line, style.fontSize));
    }

    const float totalHeight = static_cast<float>(std::max<std::size_t>(lines.size(), 1)) * lineHeightPx;
    return TextDimensions{
        std::max(maxWidth + constants::kTextPadding, constants::kTextMinWidth),
        std::max(totalHeight, lineHeightPx),
    };
}

} // namespace karta
