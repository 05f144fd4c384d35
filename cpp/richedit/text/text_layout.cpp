#include "richedit/text/text_layout.h"

#include "richedit/core/logging.h"
#include "richedit/core/string_utils.h"
#include "richedit/text/text_segmentation.h"

#include <algorithm>
#include <cmath>

namespace richedit::text {

namespace {

bool isLineTerminator(char16_t u) {
    return u == u'\n' || u == u'\r' || u == 0x2028 || u == 0x2029;
}

// Advance used for a grapheme when the shaper can not shape its run
constexpr float kFallbackAdvanceEm = 0.5f;

} // namespace

TextLayoutEngine::TextLayoutEngine(TextShaper* shaper)
    : shaper_(shaper) {
}

// =============================================================================
// Input
// =============================================================================

void TextLayoutEngine::setText(std::u16string text, std::vector<Span> spans) {
    text_ = std::move(text);
    spans_ = std::move(spans);
    if (spans_.empty() && !text_.empty()) {
        spans_.push_back(TextRunSpan{0, static_cast<std::uint32_t>(text_.size()), style_});
    }
    clustersValid_ = false;
    layout_.dirty = true;
}

void TextLayoutEngine::setPlaceholderDimensions(std::vector<PlaceholderDimensions> dimensions) {
    placeholders_ = std::move(dimensions);
    clustersValid_ = false;
    layout_.dirty = true;
}

void TextLayoutEngine::setStyle(const TextStyle& style) {
    if (style_ == style) return;
    style_ = style;
    clustersValid_ = false;
    layout_.dirty = true;
}

void TextLayoutEngine::setTextAlign(TextAlign align) {
    if (align_ == align) return;
    align_ = align;
    layout_.dirty = true;
}

void TextLayoutEngine::setTextDirection(TextDirection direction) {
    if (direction_ == direction) return;
    direction_ = direction;
    clustersValid_ = false;
    layout_.dirty = true;
}

void TextLayoutEngine::setTextScaleFactor(float scale) {
    if (scale_ == scale) return;
    scale_ = scale;
    clustersValid_ = false;
    layout_.dirty = true;
}

// =============================================================================
// Layout
// =============================================================================

void TextLayoutEngine::layout(float minWidth, float maxWidth) {
    if (!layout_.dirty && minWidth == lastMinWidth_ && maxWidth == lastMaxWidth_) {
        return;
    }
    if (!clustersValid_) {
        buildClusters();
        clustersValid_ = true;
    }

    breakLines(maxWidth);

    layout_.longestLine = 0.0f;
    layout_.height = 0.0f;
    for (const LayoutLine& line : layout_.lines) {
        layout_.longestLine = std::max(layout_.longestLine, line.fullWidth);
        layout_.height += line.lineHeight;
    }
    layout_.width = std::min(std::max(layout_.longestLine, minWidth), maxWidth);
    alignLines();

    lastMinWidth_ = minWidth;
    lastMaxWidth_ = maxWidth;
    layout_.dirty = false;
}

TextStyle TextLayoutEngine::scaledStyle(const TextStyle& style) const {
    TextStyle scaled = style;
    scaled.fontSize = style.fontSize * scale_;
    return scaled;
}

FontMetrics TextLayoutEngine::baseMetrics() const {
    return shaper_->getScaledMetrics(scaledStyle(style_));
}

float TextLayoutEngine::preferredLineHeight() const {
    const FontMetrics m = baseMetrics();
    return m.ascender - m.descender + m.lineGap;
}

std::vector<bool> TextLayoutEngine::resolveDirections() const {
    const std::size_t n = text_.size();
    const bool baseRtl = direction_ == TextDirection::RTL;

    // 0 = neutral, 1 = LTR, 2 = RTL
    std::vector<std::uint8_t> strong(n, 0);
    std::size_t pos = 0;
    while (pos < n) {
        std::uint32_t unitLen = 0;
        const char32_t cp = decodeUtf16At(text_, pos, unitLen);
        const BidiClass cls = bidiClassOf(cp);
        const std::uint8_t value = cls == BidiClass::StrongRTL ? 2 : (cls == BidiClass::StrongLTR ? 1 : 0);
        for (std::uint32_t k = 0; k < unitLen; ++k) strong[pos + k] = value;
        pos += unitLen;
    }

    // Neutrals take the direction of their strong neighbours when both agree,
    // the paragraph direction otherwise. Line terminators reset the context.
    std::vector<std::uint8_t> before(n, 0);
    std::uint8_t last = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (isLineTerminator(text_[i])) last = 0;
        before[i] = last;
        if (strong[i] != 0) last = strong[i];
    }

    std::vector<bool> rtl(n, baseRtl);
    std::uint8_t next = 0;
    for (std::size_t i = n; i-- > 0;) {
        if (isLineTerminator(text_[i])) {
            next = 0;
            rtl[i] = baseRtl;
            continue;
        }
        if (strong[i] != 0) {
            rtl[i] = strong[i] == 2;
            next = strong[i];
        } else if (before[i] != 0 && before[i] == next) {
            rtl[i] = next == 2;
        }
    }

    // A grapheme never straddles two runs
    for (std::size_t i = 1; i < n; ++i) {
        if (!isGraphemeBoundary(text_, static_cast<std::uint32_t>(i))) {
            rtl[i] = rtl[i - 1];
        }
    }
    return rtl;
}

void TextLayoutEngine::buildClusters() {
    layout_.glyphs.clear();
    layout_.clusters.clear();
    if (text_.empty()) {
        layout_.minIntrinsicWidth = 0.0f;
        layout_.maxIntrinsicWidth = 0.0f;
        return;
    }

    const std::vector<bool> rtl = resolveDirections();
    int placeholderIndex = 0;
    for (const Span& span : spans_) {
        const FontMetrics metrics = shaper_->getScaledMetrics(scaledStyle(spanStyle(span)));
        if (const auto* run = std::get_if<TextRunSpan>(&span)) {
            shapeTextRun(*run, rtl, metrics);
        } else {
            const auto& object = std::get<InlineObjectSpan>(span);
            addPlaceholderCluster(object, placeholderIndex++, rtl[object.start], metrics);
        }
    }

    computeBreakOpportunities();
    computeIntrinsicWidths();
}

void TextLayoutEngine::shapeTextRun(const TextRunSpan& span, const std::vector<bool>& rtl, const FontMetrics& metrics) {
    const TextStyle style = scaledStyle(span.style);
    const float halfGap = metrics.lineGap * 0.5f;
    const float ascent = metrics.ascender + halfGap;
    const float descent = -metrics.descender + halfGap;
    const std::uint32_t end = std::min<std::uint32_t>(span.start + span.length, static_cast<std::uint32_t>(text_.size()));

    std::uint32_t pos = span.start;
    while (pos < end) {
        if (isLineTerminator(text_[pos])) {
            std::uint32_t len = 1;
            if (text_[pos] == u'\r' && pos + 1 < end && text_[pos + 1] == u'\n') len = 2;
            layout_.clusters.push_back(LayoutCluster{
                pos, len, 0.0f, ascent, descent, -1,
                direction_ == TextDirection::RTL, false, true, false, 0.0f
            });
            pos += len;
            continue;
        }

        const bool runRtl = rtl[pos];
        std::uint32_t runEnd = pos;
        while (runEnd < end && !isLineTerminator(text_[runEnd]) && rtl[runEnd] == runRtl) {
            ++runEnd;
        }

        std::vector<ShapedGlyph> glyphs;
        const bool shaped = shaper_->shapeRun(text_, pos, runEnd, style, runRtl, glyphs);
        if (!shaped) {
            RICHEDIT_LOG_WARN("shaping failed for [%u, %u), using fallback advances", pos, runEnd);
        }

        std::vector<float> advanceAt(runEnd - pos, 0.0f);
        for (const ShapedGlyph& glyph : glyphs) {
            if (glyph.clusterIndex >= pos && glyph.clusterIndex < runEnd) {
                advanceAt[glyph.clusterIndex - pos] += glyph.xAdvance;
            }
        }

        std::uint32_t g0 = pos;
        while (g0 < runEnd) {
            const std::uint32_t g1 = std::min(nextGraphemeBoundary(text_, g0), runEnd);
            float advance = 0.0f;
            if (shaped) {
                for (std::uint32_t k = g0; k < g1; ++k) advance += advanceAt[k - pos];
            } else {
                advance = style.fontSize * kFallbackAdvanceEm;
            }
            std::uint32_t unitLen = 0;
            const char32_t cp = decodeUtf16At(text_, g0, unitLen);
            layout_.clusters.push_back(LayoutCluster{
                g0, g1 - g0, advance, ascent, descent, -1,
                runRtl, isWhitespaceCodePoint(cp), false, false, 0.0f
            });
            g0 = g1;
        }

        layout_.glyphs.insert(layout_.glyphs.end(), glyphs.begin(), glyphs.end());
        pos = runEnd;
    }
}

void TextLayoutEngine::addPlaceholderCluster(const InlineObjectSpan& span, int index, bool rtl, const FontMetrics& metrics) {
    PlaceholderDimensions dims;
    dims.alignment = span.alignment;
    if (index < static_cast<int>(placeholders_.size())) {
        dims = placeholders_[static_cast<std::size_t>(index)];
    }

    const float width = dims.size.width * scale_;
    const float height = dims.size.height * scale_;
    const float fontAscent = metrics.ascender;
    const float fontDescent = -metrics.descender;

    float ascent = 0.0f;
    float descent = 0.0f;
    switch (dims.alignment) {
        case PlaceholderAlignment::Baseline: {
            const float baseline = dims.baselineOffset ? *dims.baselineOffset * scale_ : height;
            ascent = baseline;
            descent = height - baseline;
            break;
        }
        case PlaceholderAlignment::AboveBaseline:
            ascent = height;
            break;
        case PlaceholderAlignment::BelowBaseline:
            descent = height;
            break;
        case PlaceholderAlignment::Top:
            ascent = fontAscent;
            descent = height - fontAscent;
            break;
        case PlaceholderAlignment::Bottom:
            ascent = height - fontDescent;
            descent = fontDescent;
            break;
        case PlaceholderAlignment::Middle: {
            const float mid = (fontAscent - fontDescent) * 0.5f;
            ascent = height * 0.5f + mid;
            descent = height * 0.5f - mid;
            break;
        }
    }

    std::uint32_t unitLen = 0;
    decodeUtf16At(text_, span.start, unitLen);
    layout_.clusters.push_back(LayoutCluster{
        span.start, std::max<std::uint32_t>(unitLen, 1), width, ascent, descent, index,
        rtl, false, false, false, 0.0f
    });
}

void TextLayoutEngine::computeBreakOpportunities() {
    auto& clusters = layout_.clusters;
    std::vector<CharClass> classes(clusters.size());
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        std::uint32_t unitLen = 0;
        classes[i] = clusters[i].placeholderIndex >= 0
            ? CharClass::InlineObject
            : classifyCodePoint(decodeUtf16At(text_, clusters[i].start, unitLen));
    }

    for (std::size_t i = 0; i < clusters.size(); ++i) {
        if (i + 1 == clusters.size()) {
            clusters[i].breakAfter = true;
            continue;
        }
        const CharClass cur = classes[i];
        const CharClass next = classes[i + 1];
        bool allowed = false;
        if (next == CharClass::Whitespace || next == CharClass::Newline) {
            allowed = false;  // Whitespace hangs at the end of the line
        } else if (cur == CharClass::Whitespace) {
            allowed = true;
        } else if (cur == CharClass::Hyphen && next == CharClass::Word) {
            allowed = true;
        } else if (cur == CharClass::Ideograph || next == CharClass::Ideograph ||
                   cur == CharClass::InlineObject || next == CharClass::InlineObject) {
            allowed = true;
        }
        clusters[i].breakAfter = allowed;
    }
}

void TextLayoutEngine::computeIntrinsicWidths() {
    float minWidth = 0.0f;
    float maxWidth = 0.0f;
    float segment = 0.0f;
    float hardLine = 0.0f;
    for (const LayoutCluster& c : layout_.clusters) {
        if (c.newline) {
            maxWidth = std::max(maxWidth, hardLine);
            minWidth = std::max(minWidth, segment);
            hardLine = 0.0f;
            segment = 0.0f;
            continue;
        }
        hardLine += c.advance;
        if (!c.whitespace) segment += c.advance;
        if (c.breakAfter) {
            minWidth = std::max(minWidth, segment);
            segment = 0.0f;
        }
    }
    layout_.maxIntrinsicWidth = std::max(maxWidth, hardLine);
    layout_.minIntrinsicWidth = std::max(minWidth, segment);
}

// =============================================================================
// Metrics
// =============================================================================

std::vector<LineMetrics> TextLayoutEngine::computeLineMetrics() const {
    std::vector<LineMetrics> result;
    result.reserve(layout_.lines.size());
    const bool baseRtl = direction_ == TextDirection::RTL;
    std::uint32_t number = 0;
    for (const LayoutLine& line : layout_.lines) {
        const float visibleLeft = baseRtl ? line.fullWidth - line.width : 0.0f;
        result.push_back(LineMetrics{
            line.hardBreak,
            line.ascent,
            line.descent,
            line.lineHeight,
            line.width,
            line.xOffset + visibleLeft,
            line.baseline,
            number++
        });
    }
    return result;
}

float TextLayoutEngine::computeDistanceToActualBaseline(TextBaseline baseline) const {
    if (layout_.lines.empty()) {
        const FontMetrics m = baseMetrics();
        return m.ascender + m.lineGap * 0.5f;
    }
    const LayoutLine& first = layout_.lines.front();
    switch (baseline) {
        case TextBaseline::Alphabetic:
            return first.baseline;
        case TextBaseline::Ideographic:
            return first.baseline + first.descent;
    }
    return first.baseline;
}

} // namespace richedit::text
