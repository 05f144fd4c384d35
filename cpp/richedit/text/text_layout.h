#ifndef RICHEDIT_TEXT_LAYOUT_H
#define RICHEDIT_TEXT_LAYOUT_H

#include "richedit/core/types.h"
#include "richedit/text/span_builder.h"
#include "richedit/text/text_shaper.h"
#include "richedit/text/text_types.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace richedit::text {

/**
 * TextLayoutEngine: lays out one paragraph of mixed text and inline
 * placeholders, and answers geometry queries over the result.
 *
 * Responsibilities:
 * - Shape text spans (through TextShaper) into grapheme clusters
 * - Size inline placeholders from PlaceholderDimensions and their alignment
 * - Line breaking (explicit newlines and greedy soft wrap)
 * - Simplified bidi ordering and paragraph alignment
 * - Caret, selection box, hit test and boundary queries
 *
 * Non-responsibilities:
 * - Laying out inline content (the editable does that and passes dimensions)
 * - Painting
 * - Scrolling (all coordinates are paragraph-local)
 *
 * Queries before the first layout() see an empty paragraph.
 */
class TextLayoutEngine {
public:
    explicit TextLayoutEngine(TextShaper* shaper);

    TextLayoutEngine(const TextLayoutEngine&) = delete;
    TextLayoutEngine& operator=(const TextLayoutEngine&) = delete;

    // =========================================================================
    // Input
    // =========================================================================

    /**
     * Replace the paragraph. Span lengths must add up to text.size().
     */
    void setText(std::u16string text, std::vector<Span> spans);

    /**
     * One entry per inline-object span, in span order. Sizes are unscaled;
     * the text scale factor is applied here.
     */
    void setPlaceholderDimensions(std::vector<PlaceholderDimensions> dimensions);

    /**
     * Style used for empty lines and preferredLineHeight().
     */
    void setStyle(const TextStyle& style);
    void setTextAlign(TextAlign align);
    void setTextDirection(TextDirection direction);
    void setTextScaleFactor(float scale);

    const std::u16string& text() const { return text_; }
    const std::vector<Span>& spans() const { return spans_; }
    TextDirection textDirection() const { return direction_; }
    TextAlign textAlign() const { return align_; }
    float textScaleFactor() const { return scale_; }
    bool needsLayout() const { return layout_.dirty; }

    // =========================================================================
    // Layout
    // =========================================================================

    /**
     * Lay out the paragraph. Lines wrap at maxWidth; the resulting width is
     * the longest line clamped to [minWidth, maxWidth]. No-op when nothing
     * changed since the last call with the same constraints.
     */
    void layout(float minWidth = 0.0f, float maxWidth = kUnbounded);

    float width() const { return layout_.width; }
    float height() const { return layout_.height; }
    Size size() const { return Size{layout_.width, layout_.height}; }

    float minIntrinsicWidth() const { return layout_.minIntrinsicWidth; }
    float maxIntrinsicWidth() const { return layout_.maxIntrinsicWidth; }

    /**
     * Height of one line of the base style.
     */
    float preferredLineHeight() const;

    std::vector<LineMetrics> computeLineMetrics() const;
    std::size_t lineCount() const { return layout_.lines.size(); }

    /**
     * Distance from the top of the paragraph to the first line's baseline.
     */
    float computeDistanceToActualBaseline(TextBaseline baseline) const;

    /**
     * Boxes of every inline placeholder, in placeholder order.
     */
    std::vector<TextBox> inlinePlaceholderBoxes() const;

    // =========================================================================
    // Caret and Hit Testing
    // =========================================================================

    /**
     * Top-left of the caret for a position.
     * @param caretPrototype Caret rect at the origin; its width shifts the caret
     *        inside RTL clusters
     */
    Point2 getOffsetForCaret(TextPosition position, const Rect& caretPrototype) const;

    /**
     * Height of the cluster the caret sits against.
     * @return std::nullopt for an empty paragraph
     */
    std::optional<float> getFullHeightForCaret(TextPosition position, const Rect& caretPrototype) const;

    /**
     * Closest caret position to a paragraph-local point. Never lands inside a
     * cluster (grapheme or inline placeholder).
     */
    TextPosition getPositionForOffset(Point2 offset) const;

    /**
     * Boxes covering [range.start, range.end). Each box covers only clusters
     * inside the range (partially covered ligature clusters are split
     * proportionally).
     */
    std::vector<TextBox> getBoxesForSelection(
        TextRange range,
        BoxHeightStyle heightStyle = BoxHeightStyle::Tight,
        BoxWidthStyle widthStyle = BoxWidthStyle::Tight
    ) const;

    // =========================================================================
    // Boundaries
    // =========================================================================

    TextRange getWordBoundary(TextPosition position) const;

    /**
     * Line containing the position, excluding the line's terminating newline.
     */
    TextRange getLineBoundary(TextPosition position) const;

    /**
     * Offset one code point after/before `offset`.
     * @return std::nullopt at the end/start of the text
     */
    std::optional<int> getOffsetAfter(int offset) const;
    std::optional<int> getOffsetBefore(int offset) const;

    static constexpr float kUnbounded = std::numeric_limits<float>::infinity();

private:
    // text_layout.cpp
    void buildClusters();
    void shapeTextRun(const TextRunSpan& span, const std::vector<bool>& rtl, const FontMetrics& metrics);
    void addPlaceholderCluster(const InlineObjectSpan& span, int index, bool rtl, const FontMetrics& metrics);
    void computeBreakOpportunities();
    void computeIntrinsicWidths();
    std::vector<bool> resolveDirections() const;
    FontMetrics baseMetrics() const;
    TextStyle scaledStyle(const TextStyle& style) const;

    // text_line_breaking.cpp
    void breakLines(float maxWidth);
    void finishLine(std::uint32_t first, std::uint32_t last, bool hardBreak);
    void addEmptyLine(std::uint32_t offset, bool hardBreak);
    void positionLine(LayoutLine& line);
    void alignLines();

    // text_hit_test.cpp
    std::size_t lineIndexForOffset(int offset, TextAffinity affinity) const;
    std::size_t lineIndexForY(float y) const;
    const LayoutCluster* clusterAt(int offset) const;
    std::size_t lineIndexOfCluster(std::uint32_t clusterIndex) const;
    std::optional<Rect> rectFromUpstream(int offset, const Rect& caretPrototype) const;
    std::optional<Rect> rectFromDownstream(int offset, const Rect& caretPrototype) const;
    Point2 emptyOffset() const;

    // text_selection_boxes.cpp
    TextBox clusterBox(const LayoutLine& line, const LayoutCluster& cluster) const;

    TextShaper* shaper_;

    std::u16string text_;
    std::vector<Span> spans_;
    std::vector<PlaceholderDimensions> placeholders_;
    TextStyle style_;
    TextAlign align_ = TextAlign::Start;
    TextDirection direction_ = TextDirection::LTR;
    float scale_ = 1.0f;

    TextLayout layout_;
    bool clustersValid_ = false;
    float lastMinWidth_ = -1.0f;
    float lastMaxWidth_ = -1.0f;
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_LAYOUT_H
