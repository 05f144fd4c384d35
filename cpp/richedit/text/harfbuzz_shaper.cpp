#include "richedit/text/harfbuzz_shaper.h"

#include "richedit/core/logging.h"

#include <hb.h>
#include <hb-ft.h>

namespace richedit::text {

HarfBuzzShaper::HarfBuzzShaper(FontManager& fonts)
    : fonts_(fonts)
    , buffer_(hb_buffer_create()) {
}

HarfBuzzShaper::~HarfBuzzShaper() {
    if (buffer_) {
        hb_buffer_destroy(buffer_);
        buffer_ = nullptr;
    }
}

std::uint32_t HarfBuzzShaper::resolveFont(const TextStyle& style) const {
    return fonts_.getFontVariant(
        style.fontId,
        hasFlag(style.flags, TextStyleFlags::Bold),
        hasFlag(style.flags, TextStyleFlags::Italic)
    );
}

bool HarfBuzzShaper::shapeRun(
    std::u16string_view text,
    std::uint32_t start,
    std::uint32_t end,
    const TextStyle& style,
    bool rtl,
    std::vector<ShapedGlyph>& outGlyphs
) {
    if (start >= end || end > text.size()) {
        return start == end;
    }

    const std::uint32_t fontId = resolveFont(style);
    const LoadedFont* font = fonts_.getFont(fontId);
    if (!font || !font->hbFont || !buffer_) {
        RICHEDIT_LOG_WARN("no font to shape run [%u, %u)", start, end);
        return false;
    }
    fonts_.setFontSize(fontId, style.fontSize);

    hb_buffer_reset(buffer_);
    hb_buffer_set_cluster_level(buffer_, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_GRAPHEMES);
    // Whole text as context, only [start, end) is shaped. Cluster values are
    // then absolute UTF-16 offsets.
    hb_buffer_add_utf16(
        buffer_,
        reinterpret_cast<const std::uint16_t*>(text.data()),
        static_cast<int>(text.size()),
        start,
        static_cast<int>(end - start)
    );
    hb_buffer_guess_segment_properties(buffer_);
    hb_buffer_set_direction(buffer_, rtl ? HB_DIRECTION_RTL : HB_DIRECTION_LTR);

    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);
    hb_shape(font->hbFont, buffer_, features, 2);

    unsigned int count = 0;
    hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer_, &count);
    hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer_, &count);
    if (!infos || !positions) {
        RICHEDIT_LOG_WARN("shaping produced no glyph data for [%u, %u)", start, end);
        return false;
    }

    // 26.6 fixed point
    constexpr float kScale = 1.0f / 64.0f;
    outGlyphs.reserve(outGlyphs.size() + count);
    for (unsigned int i = 0; i < count; ++i) {
        ShapedGlyph glyph;
        glyph.glyphId = infos[i].codepoint;
        glyph.clusterIndex = infos[i].cluster;
        glyph.xAdvance = positions[i].x_advance * kScale;
        glyph.yAdvance = positions[i].y_advance * kScale;
        glyph.xOffset = positions[i].x_offset * kScale;
        glyph.yOffset = positions[i].y_offset * kScale;
        glyph.flags = rtl ? 1u : 0u;
        outGlyphs.push_back(glyph);
    }
    return true;
}

FontMetrics HarfBuzzShaper::getScaledMetrics(const TextStyle& style) const {
    return fonts_.getScaledMetrics(resolveFont(style), style.fontSize);
}

} // namespace richedit::text
