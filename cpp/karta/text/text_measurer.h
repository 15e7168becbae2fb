#pragma once

#include "karta/core/constants.h"
#include "karta/scene/scene_object.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace karta {

struct TextStyle {
    float fontSize = constants::kDefaultFontSize;
    std::string fontFamily;
    std::uint16_t fontWeight = 400;
    bool italic = false;
    float lineHeight = constants::kDefaultLineHeight;
};

struct TextDimensions {
    float width;
    float height;
};

TextStyle textStyleOf(const SceneObject& obj);

// Width of one shaped line. Implemented by the font backend; nullopt when it
// has no face for the style.
class LineShaper {
public:
    virtual ~LineShaper() = default;
    virtual std::optional<float> shapedWidth(const std::string& utf8, const TextStyle& style) = 0;
};

// Bounding box of a text block: lines split on '\n', width is the widest line
// plus padding (at least kTextMinWidth), height is lines * fontSize * lineHeight.
// Without a shaper, or when it cannot shape a line, every code point counts
// as kFallbackAdvanceEm.
class TextMeasurer {
public:
    explicit TextMeasurer(LineShaper* shaper = nullptr) : shaper_(shaper) {}

    void setShaper(LineShaper* shaper) { shaper_ = shaper; }
    LineShaper* shaper() const { return shaper_; }

    TextDimensions measure(const std::string& text, const TextStyle& style) const;
    TextDimensions measure(const SceneObject& obj) const { return measure(obj.text, textStyleOf(obj)); }

    static float fallbackLineWidth(const std::string& line, float fontSize);
    static std::size_t codePointCount(const std::string& utf8);

private:
    LineShaper* shaper_;
};

} // namespace karta
