#include "richedit/text/font_manager.h"

#include "richedit/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <fstream>

namespace richedit::text {

namespace {

void destroyFont(LoadedFont& font) {
    if (font.hbFont) {
        hb_font_destroy(font.hbFont);
        font.hbFont = nullptr;
    }
    if (font.ftFace) {
        FT_Done_Face(font.ftFace);
        font.ftFace = nullptr;
    }
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
    if (FT_Init_FreeType(&ftLibrary_) != 0) {
        RICHEDIT_LOG_WARN("FreeType initialization failed");
        ftLibrary_ = nullptr;
        return false;
    }
    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }
    for (auto& [id, font] : fonts_) {
        (void)id;
        if (font) destroyFont(*font);
    }
    fonts_.clear();
    familyMap_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }
    initialized_ = false;
}

// =============================================================================
// Loading
// =============================================================================

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* data,
    std::size_t size,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_ || !data || size == 0) {
        return 0;
    }
    std::vector<std::uint8_t> copy(data, data + size);
    return addFace(nextFontId_, std::move(copy), familyName, bold, italic);
}

std::uint32_t FontManager::loadFontFromFile(const std::string& path, bool bold, bool italic) {
    if (!initialized_) {
        return 0;
    }
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        RICHEDIT_LOG_WARN("cannot open font file %s", path.c_str());
        return 0;
    }
    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        RICHEDIT_LOG_WARN("short read on font file %s", path.c_str());
        return 0;
    }
    return addFace(nextFontId_, std::move(buffer), "", bold, italic);
}

std::uint32_t FontManager::addFace(
    std::uint32_t fontId,
    std::vector<std::uint8_t>&& data,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    FT_Face face = nullptr;
    const FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        data.data(),
        static_cast<FT_Long>(data.size()),
        0,
        &face
    );
    if (error || !face) {
        RICHEDIT_LOG_WARN("FT_New_Memory_Face failed (error %d)", static_cast<int>(error));
        return 0;
    }

    auto font = std::make_unique<LoadedFont>();
    font->id = fontId;
    font->familyName = familyName;
    if (font->familyName.empty()) {
        font->familyName = face->family_name ? face->family_name : "Unknown";
    }
    font->bold = bold;
    font->italic = italic;
    font->ftFace = face;
    font->fontData = std::move(data);
    font->metrics = extractMetrics(face);
    font->hbFont = hb_ft_font_create(face, nullptr);
    if (!font->hbFont) {
        FT_Done_Face(face);
        return 0;
    }

    familyMap_[font->familyName].push_back(fontId);
    fonts_[fontId] = std::move(font);
    nextFontId_ = std::max(nextFontId_, fontId + 1);
    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }
    RICHEDIT_LOG_DEBUG("loaded font %u", fontId);
    return fontId;
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    auto family = familyMap_.find(it->second->familyName);
    if (family != familyMap_.end()) {
        auto& ids = family->second;
        ids.erase(std::remove(ids.begin(), ids.end(), fontId), ids.end());
        if (ids.empty()) familyMap_.erase(family);
    }

    destroyFont(*it->second);
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }
    return true;
}

// =============================================================================
// Access
// =============================================================================

LoadedFont* FontManager::findFont(std::uint32_t fontId) const {
    const std::uint32_t resolved = fontId == 0 ? defaultFontId_ : fontId;
    auto it = fonts_.find(resolved);
    return it != fonts_.end() ? it->second.get() : nullptr;
}

const LoadedFont* FontManager::getFont(std::uint32_t fontId) const {
    return findFont(fontId);
}

std::uint32_t FontManager::getFontVariant(std::uint32_t baseFontId, bool bold, bool italic) const {
    const LoadedFont* base = findFont(baseFontId);
    if (!base) {
        return baseFontId;
    }
    if (base->bold == bold && base->italic == italic) {
        return base->id;
    }
    auto family = familyMap_.find(base->familyName);
    if (family != familyMap_.end()) {
        for (std::uint32_t id : family->second) {
            const LoadedFont* candidate = findFont(id);
            if (candidate && candidate->bold == bold && candidate->italic == italic) {
                return id;
            }
        }
    }
    return base->id;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const LoadedFont* font = findFont(fontId);
    FontMetrics scaled{};
    if (!font) {
        scaled.unitsPerEM = 1000.0f;
        scaled.ascender = fontSize * 0.8f;
        scaled.descender = fontSize * -0.2f;
        scaled.lineGap = fontSize * 0.1f;
        scaled.underlinePosition = fontSize * -0.1f;
        scaled.underlineThickness = fontSize * 0.05f;
        return scaled;
    }

    const float scale = fontSize / font->metrics.unitsPerEM;
    scaled.unitsPerEM = font->metrics.unitsPerEM;
    scaled.ascender = font->metrics.ascender * scale;
    scaled.descender = font->metrics.descender * scale;
    scaled.lineGap = font->metrics.lineGap * scale;
    scaled.underlinePosition = font->metrics.underlinePosition * scale;
    scaled.underlineThickness = font->metrics.underlineThickness * scale;
    return scaled;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    LoadedFont* font = findFont(fontId);
    if (!font || !font->ftFace) {
        return false;
    }
    const auto size26_6 = static_cast<FT_F26Dot6>(fontSize * 64.0f);
    if (FT_Set_Char_Size(font->ftFace, 0, size26_6, 72, 72) != 0) {
        return false;
    }
    if (font->hbFont) {
        hb_font_set_scale(font->hbFont, static_cast<int>(size26_6), static_cast<int>(size26_6));
    }
    return true;
}

FontMetrics FontManager::extractMetrics(FT_Face face) {
    FontMetrics metrics{};
    metrics.unitsPerEM = face->units_per_EM > 0 ? static_cast<float>(face->units_per_EM) : 1000.0f;
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);
    metrics.underlinePosition = static_cast<float>(face->underline_position);
    metrics.underlineThickness = static_cast<float>(face->underline_thickness);

    // Prefer OS/2 typographic metrics when the font provides them
    auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }
    return metrics;
}

} // namespace richedit::text
