#include "karta/text/font_manager.h"
#include "karta/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace karta {

namespace {

std::string normalizeFamily(std::string name) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), notSpace));
    name.erase(std::find_if(name.rbegin(), name.rend(), notSpace).base(), name.end());
    if (name.size() >= 2 && (name.front() == '"' || name.front() == '\'') && name.back() == name.front()) {
        name = name.substr(1, name.size() - 2);
    }
    std::transform(name.begin(), name.end(), name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::vector<std::string> splitFamilyList(const std::string& list) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start <= list.size()) {
        const auto comma = list.find(',', start);
        const std::string part = normalizeFamily(list.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!part.empty()) out.push_back(part);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

} // namespace

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        KARTA_LOG_WARN("FreeType initialisation failed (%d)", static_cast<int>(error));
        return false;
    }

    hbBuffer_ = hb_buffer_create();
    if (!hb_buffer_allocation_successful(hbBuffer_)) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::destroyHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) destroyHandle(*handle);
    }
    fonts_.clear();
    familyMap_.clear();
    defaultFontId_ = 0;

    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

// ==============================================================================
// Loading
// ==============================================================================

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from this buffer for the lifetime of the face.
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face
    );
    if (error || !face) {
        KARTA_LOG_WARN("FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    const std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family, bold, italic);
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    familyMap_[normalizeFamily(family)].push_back(fontId);
    fonts_[fontId] = std::move(handle);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }
    KARTA_LOG_DEBUG("loaded font %u (%s)", fontId, family.c_str());
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, bool bold, bool italic) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }
    return loadFontFromMemory(buffer.data(), buffer.size(), "", bold, italic);
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) {
        auto fam = familyMap_.find(normalizeFamily(it->second->familyName));
        if (fam != familyMap_.end()) {
            auto& ids = fam->second;
            ids.erase(std::remove(ids.begin(), ids.end(), fontId), ids.end());
            if (ids.empty()) familyMap_.erase(fam);
        }
        destroyHandle(*it->second);
    }
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }
    return true;
}

// ==============================================================================
// Access
// ==============================================================================

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

std::uint32_t FontManager::findFont(const std::string& familyList, bool bold, bool italic) const {
    for (const std::string& family : splitFamilyList(familyList)) {
        auto it = familyMap_.find(family);
        if (it == familyMap_.end() || it->second.empty()) continue;

        std::uint32_t best = it->second.front();
        for (std::uint32_t id : it->second) {
            const FontHandle* h = getFont(id);
            if (h && h->bold == bold && h->italic == italic) {
                best = id;
                break;
            }
        }
        return best;
    }
    return defaultFontId_;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const FontHandle* handle = getFont(fontId);
    if (!handle || handle->metrics.unitsPerEM <= 0.0f) {
        return FontMetrics{1000.0f, fontSize * 0.8f, fontSize * -0.2f, fontSize * 0.1f};
    }

    const float scale = fontSize / handle->metrics.unitsPerEM;
    return FontMetrics{
        handle->metrics.unitsPerEM,
        handle->metrics.ascender * scale,
        handle->metrics.descender * scale,
        handle->metrics.lineGap * scale,
    };
}

// ==============================================================================
// Shaping
// ==============================================================================

bool FontManager::setFontSize(FontHandle& handle, float fontSize) {
    if (!handle.ftFace) {
        return false;
    }

    // 26.6 fixed point at 72 DPI, so one point is one canvas unit.
    FT_Error error = FT_Set_Char_Size(
        handle.ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSize * 64),
        72,
        72
    );
    if (error) {
        return false;
    }

    if (handle.hbFont) {
        hb_ft_font_changed(handle.hbFont);
        hb_font_set_scale(handle.hbFont, static_cast<int>(fontSize * 64), static_cast<int>(fontSize * 64));
    }
    return true;
}

std::optional<float> FontManager::shapedWidth(const std::string& utf8, const TextStyle& style) {
    if (!initialized_ || !hbBuffer_ || style.fontSize <= 0.0f) {
        return std::nullopt;
    }

    const std::uint32_t fontId = findFont(style.fontFamily, style.fontWeight >= 600, style.italic);
    auto it = fonts_.find(fontId);
    if (it == fonts_.end() || !it->second || !it->second->hbFont) {
        return std::nullopt;
    }
    FontHandle& handle = *it->second;
    if (!setFontSize(handle, style.fontSize)) {
        return std::nullopt;
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, utf8.data(), static_cast<int>(utf8.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);

    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);
    hb_shape(handle.hbFont, hbBuffer_, features, 2);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!positions) {
        return std::nullopt;
    }

    float advance = 0.0f;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += static_cast<float>(positions[i].x_advance) / 64.0f;
    }
    return advance;
}

// ==============================================================================
// Helpers
// ==============================================================================

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->bold = bold;
    handle->italic = italic;
    handle->ftFace = face;
    handle->fontData = std::move(fontData);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }

    handle->metrics = extractMetrics(face);
    return handle;
}

FontMetrics FontManager::extractMetrics(FT_Face face) const {
    if (!face) {
        return FontMetrics{1000.0f, 800.0f, -200.0f, 0.0f};
    }

    FontMetrics metrics{};
    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    // sTypoAscender/Descender are more reliable when present.
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }
    return metrics;
}

} // namespace karta
