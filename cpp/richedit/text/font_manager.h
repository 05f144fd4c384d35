#ifndef RICHEDIT_TEXT_FONT_MANAGER_H
#define RICHEDIT_TEXT_FONT_MANAGER_H

#include "richedit/text/text_types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace richedit::text {

/**
 * LoadedFont: a FreeType face plus the HarfBuzz font shaping it.
 */
struct LoadedFont {
    std::uint32_t id;
    std::string familyName;
    bool bold;
    bool italic;

    FT_Face ftFace;
    hb_font_t* hbFont;

    // Design-unit metrics, scaled by getScaledMetrics()
    FontMetrics metrics;

    // FreeType reads the face from this buffer for its whole lifetime
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and every loaded face.
 *
 * Font id 0 always means "the default font", which is the first font loaded
 * unless changed with setDefaultFontId().
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * Load a TTF/OTF font from memory. The data is copied.
     * @return Font id, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* data,
        std::size_t size,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    /**
     * @return Font id, or 0 if the file can not be read or parsed
     */
    std::uint32_t loadFontFromFile(const std::string& path, bool bold = false, bool italic = false);

    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Access
    // =========================================================================

    /**
     * @param fontId Font id (0 = default font)
     * @return The font, or nullptr if not loaded
     */
    const LoadedFont* getFont(std::uint32_t fontId) const;

    bool hasFont(std::uint32_t fontId) const { return getFont(fontId) != nullptr; }

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }
    void setDefaultFontId(std::uint32_t fontId) { defaultFontId_ = fontId; }

    /**
     * Bold/italic sibling of a font in the same family.
     * @return The variant's id, or the resolved base id when the family has none
     */
    std::uint32_t getFontVariant(std::uint32_t baseFontId, bool bold, bool italic) const;

    /**
     * Metrics scaled to a pixel size. Unknown fonts get proportional defaults
     * so layout can proceed without any font loaded.
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

    /**
     * Configure the FreeType char size and the HarfBuzz scale (26.6 fixed point).
     */
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    std::uint32_t addFace(
        std::uint32_t fontId,
        std::vector<std::uint8_t>&& data,
        const std::string& familyName,
        bool bold,
        bool italic
    );
    LoadedFont* findFont(std::uint32_t fontId) const;
    static FontMetrics extractMetrics(FT_Face face);

    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<LoadedFont>> fonts_;
    std::unordered_map<std::string, std::vector<std::uint32_t>> familyMap_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_FONT_MANAGER_H
