#ifndef KARTA_TEXT_FONT_MANAGER_H
#define KARTA_TEXT_FONT_MANAGER_H

#include "karta/text/text_measurer.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;
typedef struct hb_buffer_t hb_buffer_t;

namespace karta {

// Design-unit metrics; multiply by fontSize / unitsPerEM.
struct FontMetrics {
    float unitsPerEM;
    float ascender;
    float descender;
    float lineGap;
};

/**
 * FontHandle: a loaded face with its FreeType and HarfBuzz objects.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;
    bool bold;
    bool italic;

    FT_Face ftFace;
    hb_font_t* hbFont;

    FontMetrics metrics;

    // Kept alive while the face is loaded.
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: loads fonts through FreeType and shapes single lines with
 * HarfBuzz for text measurement.
 *
 * Families are looked up by the CSS-style list stored on text objects
 * ("Inter, system-ui, sans-serif"): the first loaded family wins, then the
 * default font. With no fonts loaded, shapedWidth() returns nullopt and the
 * measurer falls back to its per-character estimate.
 */
class FontManager : public LineShaper {
public:
    FontManager();
    ~FontManager() override;

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    bool initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory. The data is copied.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    std::uint32_t loadFontFromFile(const std::string& filePath, bool bold = false, bool italic = false);

    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Font Access
    // =========================================================================

    // fontId 0 is the default font.
    const FontHandle* getFont(std::uint32_t fontId) const;
    bool hasFont(std::uint32_t fontId) const;
    std::size_t fontCount() const { return fonts_.size(); }

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }
    void setDefaultFontId(std::uint32_t fontId) { defaultFontId_ = fontId; }

    // Best match for a CSS family list and variant; 0 when nothing is loaded.
    std::uint32_t findFont(const std::string& familyList, bool bold, bool italic) const;

    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

    // =========================================================================
    // Shaping
    // =========================================================================

    std::optional<float> shapedWidth(const std::string& utf8, const TextStyle& style) override;

private:
    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName,
        bool bold,
        bool italic
    );
    FontMetrics extractMetrics(FT_Face face) const;
    bool setFontSize(FontHandle& handle, float fontSize);
    void destroyHandle(FontHandle& handle);

    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;
    hb_buffer_t* hbBuffer_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    // Lower-cased family name -> font ids
    std::unordered_map<std::string, std::vector<std::uint32_t>> familyMap_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace karta

#endif // KARTA_TEXT_FONT_MANAGER_H
