#include <gtest/gtest.h>
#include "karta/text/font_manager.h"
#include "karta/text/text_measurer.h"

#include <cstdint>
#include <vector>

using namespace karta;

namespace {

// Fixed advance per byte, refuses lines containing '!'.
class FixedShaper : public LineShaper {
public:
    std::optional<float> shapedWidth(const std::string& utf8, const TextStyle& style) override {
        calls++;
        if (utf8.find('!') != std::string::npos) return std::nullopt;
        return static_cast<float>(utf8.size()) * style.fontSize * 0.5f;
    }
    int calls = 0;
};

} // namespace

// =============================================================================
// Fallback estimate
// =============================================================================

TEST(TextMeasurerTest, FallbackWidthAndHeight) {
    TextMeasurer measurer;
    TextStyle style;
    style.fontSize = 20.0f;
    style.lineHeight = 1.5f;

    const TextDimensions d = measurer.measure("Hello", style);
    // 5 * 20 * 0.6 + 4
    EXPECT_FLOAT_EQ(d.width, 64.0f);
    EXPECT_FLOAT_EQ(d.height, 30.0f);
}

TEST(TextMeasurerTest, WidestLineWinsAndEveryLineCounts) {
    TextMeasurer measurer;
    TextStyle style;
    style.fontSize = 10.0f;
    style.lineHeight = 1.0f;

    const TextDimensions d = measurer.measure("ab\nabcdef\n", style);
    EXPECT_FLOAT_EQ(d.width, 6 * 10 * 0.6f + 4.0f);
    EXPECT_FLOAT_EQ(d.height, 30.0f);
}

TEST(TextMeasurerTest, EmptyTextKeepsMinimumBox) {
    TextMeasurer measurer;
    const TextDimensions d = measurer.measure("", TextStyle{});
    EXPECT_FLOAT_EQ(d.width, constants::kTextMinWidth);
    EXPECT_FLOAT_EQ(d.height, constants::kDefaultFontSize * constants::kDefaultLineHeight);
}

TEST(TextMeasurerTest, CountsCodePointsNotBytes) {
    EXPECT_EQ(TextMeasurer::codePointCount("abc"), 3u);
    EXPECT_EQ(TextMeasurer::codePointCount("h\xC3\xA9llo"), 5u);
    EXPECT_EQ(TextMeasurer::codePointCount("\xE2\x82\xAC\xF0\x9F\x98\x80"), 2u);
    EXPECT_FLOAT_EQ(TextMeasurer::fallbackLineWidth("\xC3\xA9\xC3\xA9", 10.0f), 12.0f);
}

TEST(TextMeasurerTest, MeasuresObjectWithItsStyle) {
    SceneObject obj = makeObject(ObjectKind::Text, "t", 0, 0, 10, 10, 0);
    obj.text = "abcd";
    obj.fontSize = 10.0f;
    obj.lineHeight = 2.0f;

    TextMeasurer measurer;
    const TextDimensions d = measurer.measure(obj);
    EXPECT_FLOAT_EQ(d.width, 28.0f);
    EXPECT_FLOAT_EQ(d.height, 20.0f);
}

// =============================================================================
// Shaper backend
// =============================================================================

TEST(TextMeasurerTest, ShaperWidthIsUsedPerLine) {
    FixedShaper shaper;
    TextMeasurer measurer(&shaper);
    TextStyle style;
    style.fontSize = 10.0f;

    const TextDimensions d = measurer.measure("abcd\nxy!", style);
    // Line one shaped (20), line two falls back (3 * 6 = 18).
    EXPECT_FLOAT_EQ(d.width, 24.0f);
    EXPECT_EQ(shaper.calls, 2);
}

TEST(FontManagerTest, WithoutFontsShapingIsUnavailable) {
    FontManager fonts;
    TextStyle style;
    EXPECT_FALSE(fonts.shapedWidth("abc", style).has_value());

    ASSERT_TRUE(fonts.initialize());
    EXPECT_EQ(fonts.fontCount(), 0u);
    EXPECT_EQ(fonts.findFont("Inter, sans-serif", false, false), 0u);
    EXPECT_FALSE(fonts.shapedWidth("abc", style).has_value());

    // The measurer then uses its estimate.
    TextMeasurer measurer(&fonts);
    EXPECT_FLOAT_EQ(measurer.measure("abc", style).width, 3 * 16 * 0.6f + 4.0f);
}

TEST(FontManagerTest, RejectsGarbageFontData) {
    FontManager fonts;
    ASSERT_TRUE(fonts.initialize());
    const std::vector<std::uint8_t> junk(64, 0x5A);
    EXPECT_EQ(fonts.loadFontFromMemory(junk.data(), junk.size(), "Junk"), 0u);
    EXPECT_EQ(fonts.loadFontFromFile("/nonexistent/font.ttf"), 0u);
    EXPECT_EQ(fonts.fontCount(), 0u);
}
