#ifndef RICHEDIT_TEXT_HARFBUZZ_SHAPER_H
#define RICHEDIT_TEXT_HARFBUZZ_SHAPER_H

#include "richedit/text/font_manager.h"
#include "richedit/text/text_shaper.h"

typedef struct hb_buffer_t hb_buffer_t;

namespace richedit::text {

/**
 * HarfBuzzShaper: TextShaper over fonts owned by a FontManager.
 *
 * Bold/italic styles pick the family variant when one is loaded. Ligatures
 * are disabled so every grapheme keeps its own glyph(s) for caret placement.
 */
class HarfBuzzShaper : public TextShaper {
public:
    explicit HarfBuzzShaper(FontManager& fonts);
    ~HarfBuzzShaper() override;

    HarfBuzzShaper(const HarfBuzzShaper&) = delete;
    HarfBuzzShaper& operator=(const HarfBuzzShaper&) = delete;

    bool shapeRun(
        std::u16string_view text,
        std::uint32_t start,
        std::uint32_t end,
        const TextStyle& style,
        bool rtl,
        std::vector<ShapedGlyph>& outGlyphs
    ) override;

    FontMetrics getScaledMetrics(const TextStyle& style) const override;

private:
    std::uint32_t resolveFont(const TextStyle& style) const;

    FontManager& fonts_;
    hb_buffer_t* buffer_ = nullptr;  // Reused for every run
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_HARFBUZZ_SHAPER_H
