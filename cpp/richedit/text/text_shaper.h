#ifndef RICHEDIT_TEXT_SHAPER_H
#define RICHEDIT_TEXT_SHAPER_H

#include "richedit/text/text_types.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace richedit::text {

/**
 * TextShaper: the glyph-level primitive the layout engine is built on.
 *
 * Implementations shape one single-direction, single-style run at a time.
 * The layout engine does its own clustering, line breaking and positioning.
 */
class TextShaper {
public:
    virtual ~TextShaper() = default;

    /**
     * Shape text[start, end) and append the glyphs to outGlyphs in visual
     * order. ShapedGlyph::clusterIndex is an absolute UTF-16 offset into `text`.
     * @param rtl Resolved direction of the run
     * @return False if the run could not be shaped (no glyphs appended)
     */
    virtual bool shapeRun(
        std::u16string_view text,
        std::uint32_t start,
        std::uint32_t end,
        const TextStyle& style,
        bool rtl,
        std::vector<ShapedGlyph>& outGlyphs
    ) = 0;

    /**
     * Metrics of the style's font at style.fontSize, in pixels.
     */
    virtual FontMetrics getScaledMetrics(const TextStyle& style) const = 0;
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_SHAPER_H
