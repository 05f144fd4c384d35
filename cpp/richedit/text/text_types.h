#ifndef RICHEDIT_TEXT_TYPES_H
#define RICHEDIT_TEXT_TYPES_H

#include "richedit/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace richedit::text {

// ============================================================================
// Styles
// ============================================================================

enum class TextStyleFlags : std::uint8_t {
    None = 0,
    Bold = 1 << 0,
    Italic = 1 << 1,
    Underline = 1 << 2,
    Strike = 1 << 3,
};

inline TextStyleFlags operator|(TextStyleFlags a, TextStyleFlags b) {
    return static_cast<TextStyleFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline TextStyleFlags operator&(TextStyleFlags a, TextStyleFlags b) {
    return static_cast<TextStyleFlags>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

inline bool hasFlag(TextStyleFlags flags, TextStyleFlags flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

struct TextStyle {
    std::uint32_t fontId = 0;   // 0 = default font
    float fontSize = 16.0f;
    Color color{0.0f, 0.0f, 0.0f, 1.0f};
    TextStyleFlags flags = TextStyleFlags::None;
};

inline bool operator==(const TextStyle& a, const TextStyle& b) {
    return a.fontId == b.fontId && a.fontSize == b.fontSize && a.color == b.color && a.flags == b.flags;
}
inline bool operator!=(const TextStyle& a, const TextStyle& b) { return !(a == b); }

// ============================================================================
// Positions and Ranges (UTF-16 code unit offsets)
// ============================================================================

enum class TextAffinity : std::uint8_t {
    Upstream = 0,
    Downstream = 1,
};

struct TextPosition {
    int offset = 0;
    TextAffinity affinity = TextAffinity::Downstream;
};

inline bool operator==(const TextPosition& a, const TextPosition& b) {
    return a.offset == b.offset && a.affinity == b.affinity;
}
inline bool operator!=(const TextPosition& a, const TextPosition& b) { return !(a == b); }

struct TextRange {
    int start = -1;
    int end = -1;

    static TextRange empty() { return TextRange{-1, -1}; }
    static TextRange collapsed(int offset) { return TextRange{offset, offset}; }

    bool isValid() const { return start >= 0 && end >= 0; }
    bool isCollapsed() const { return start == end; }
    bool isNormalized() const { return end >= start; }

    // Require a valid, normalized range inside `text`.
    std::u16string textBefore(std::u16string_view text) const {
        return std::u16string(text.substr(0, static_cast<std::size_t>(start)));
    }
    std::u16string textInside(std::u16string_view text) const {
        return std::u16string(text.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(end - start)));
    }
    std::u16string textAfter(std::u16string_view text) const {
        return std::u16string(text.substr(static_cast<std::size_t>(end)));
    }
};

inline bool operator==(const TextRange& a, const TextRange& b) { return a.start == b.start && a.end == b.end; }
inline bool operator!=(const TextRange& a, const TextRange& b) { return !(a == b); }

// ============================================================================
// Inline Placeholders
// ============================================================================

enum class PlaceholderAlignment : std::uint8_t {
    Baseline = 0,
    AboveBaseline = 1,
    BelowBaseline = 2,
    Top = 3,
    Bottom = 4,
    Middle = 5,
};

enum class TextBaseline : std::uint8_t {
    Alphabetic = 0,
    Ideographic = 1,
};

// Alignments whose vertical placement cannot be known without a full layout.
inline bool requiresBaseline(PlaceholderAlignment alignment) {
    return alignment == PlaceholderAlignment::Baseline ||
           alignment == PlaceholderAlignment::AboveBaseline ||
           alignment == PlaceholderAlignment::BelowBaseline;
}

struct PlaceholderDimensions {
    Size size;
    PlaceholderAlignment alignment = PlaceholderAlignment::Bottom;
    std::optional<TextBaseline> baseline;
    std::optional<float> baselineOffset;  // Distance from top to baseline (Baseline alignment)
};

// ============================================================================
// Geometry Results
// ============================================================================

struct TextBox {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    TextDirection direction = TextDirection::LTR;

    float start() const { return direction == TextDirection::LTR ? left : right; }
    float end() const { return direction == TextDirection::LTR ? right : left; }
    Rect toRect() const { return Rect{left, top, right, bottom}; }
};

inline bool operator==(const TextBox& a, const TextBox& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom && a.direction == b.direction;
}

enum class BoxHeightStyle : std::uint8_t {
    Tight = 0,  // Glyph/placeholder extents
    Max = 1,    // Full line height
};

enum class BoxWidthStyle : std::uint8_t {
    Tight = 0,
    Max = 1,    // Extend lines the selection continues across to the paragraph edges
};

struct LineMetrics {
    bool hardBreak;
    float ascent;     // Positive, above baseline
    float descent;    // Positive, below baseline
    float height;
    float width;
    float left;
    float baseline;   // Y of the baseline from the top of the paragraph
    std::uint32_t lineNumber;
};

// Font metrics cached per font
struct FontMetrics {
    float unitsPerEM;
    float ascender;             // Positive, above baseline
    float descender;            // Negative, below baseline
    float lineGap;
    float underlinePosition;
    float underlineThickness;
};

// ============================================================================
// Internal Layout Types
// ============================================================================

// Shaped glyph info (output from the shaper)
struct ShapedGlyph {
    std::uint32_t glyphId;      // Font-specific glyph index
    std::uint32_t clusterIndex; // UTF-16 offset this glyph maps to
    float xAdvance;
    float yAdvance;
    float xOffset;
    float yOffset;
    std::uint32_t flags;        // Bitfield: 1 = RTL
};

// The smallest unit the caret can not split: a grapheme (or ligature) of text,
// or exactly one inline placeholder.
struct LayoutCluster {
    std::uint32_t start;        // UTF-16 offset
    std::uint32_t length;       // UTF-16 length
    float advance;
    float ascent;               // Positive, above baseline
    float descent;              // Positive, below baseline
    int placeholderIndex;       // -1 for text
    bool rtl;
    bool whitespace;
    bool newline;
    bool breakAfter;            // Soft line-break opportunity after this cluster
    float x;                    // Visual left edge, line-relative (set during positioning)
};

// A laid-out line
struct LayoutLine {
    std::uint32_t startCluster;
    std::uint32_t clusterCount;
    std::uint32_t startOffset;          // UTF-16 offset of first character
    std::uint32_t endOffset;            // Excludes the terminating newline
    std::uint32_t endIncludingNewline;
    float width;                        // Excludes trailing whitespace
    float fullWidth;                    // Includes trailing whitespace
    float ascent;
    float descent;
    float lineHeight;
    float top;
    float baseline;                     // Absolute Y of the baseline
    float xOffset;                      // Horizontal offset for alignment
    bool hardBreak;
};

// Complete layout result for one paragraph
struct TextLayout {
    std::vector<ShapedGlyph> glyphs;
    std::vector<LayoutCluster> clusters;
    std::vector<LayoutLine> lines;
    float width = 0.0f;                 // Paragraph width after min/max clamping
    float height = 0.0f;
    float longestLine = 0.0f;
    float minIntrinsicWidth = 0.0f;
    float maxIntrinsicWidth = 0.0f;
    bool dirty = true;
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_TYPES_H
