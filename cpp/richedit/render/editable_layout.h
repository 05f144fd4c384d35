#ifndef RICHEDIT_RENDER_EDITABLE_LAYOUT_H
#define RICHEDIT_RENDER_EDITABLE_LAYOUT_H

#include "richedit/core/types.h"
#include "richedit/editing/editing_value.h"
#include "richedit/render/editable_config.h"
#include "richedit/text/span_builder.h"
#include "richedit/text/text_layout.h"
#include "richedit/text/text_shaper.h"
#include "richedit/text/text_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace richedit::render {

using editing::TextSelection;
using text::TextPosition;
using text::TextRange;

// Gap between the end of the text and the caret.
constexpr float kCaretGap = 1.0f;
// Vertical inset of the Inset caret style.
constexpr float kCaretHeightOffset = 2.0f;
// Slop when testing whether a selection end lies inside the viewport.
constexpr float kVisibleRegionSlop = 0.5f;
// Floating cursor growth over the caret prototype.
constexpr EdgeInsets kFloatingCaretSizeIncrease{0.5f, 1.0f, 0.5f, 1.0f};
constexpr float kFloatingCaretRadius = 1.0f;

enum class FloatingCursorDragState : std::uint8_t {
    Start = 0,
    Update = 1,
    End = 2,
};

// A selection endpoint in editable-local coordinates. The direction is unset
// for a collapsed selection.
struct SelectionPoint {
    Point2 point;
    std::optional<TextDirection> direction;
};

// Where an inline child was placed by the last layout, in text coordinates.
struct ChildPlacement {
    text::InlineContent* content = nullptr;
    Point2 offset;
    Size size;          // Unscaled
    float scale = 1.0f;
};

/**
 * EditableLayout: the render side of one editable field.
 *
 * Wraps a TextLayoutEngine with what an editing surface needs on top of a
 * paragraph:
 * - Laying out inline children and feeding their sizes back as placeholders
 * - Line-count driven height (minLines / maxLines / expands)
 * - Dry layout and intrinsic sizes (unavailable with baseline-aligned children)
 * - Caret prototype, caret margin and scrolling along one axis
 * - Caret, selection endpoint, composing rect and hit-test queries
 * - Floating-cursor bounds
 *
 * Coordinates: "local" means editable-local (scroll applied). "Text"
 * coordinates are paragraph-local (scroll not applied).
 *
 * Intrinsic and dry-layout queries overwrite the paragraph's placeholder
 * sizes; every geometry query restores the sizes of the last full layout
 * before answering, so geometry queries are valid only after layout().
 */
class EditableLayout {
public:
    explicit EditableLayout(text::TextShaper* shaper, EditableConfig config = EditableConfig{});

    EditableLayout(const EditableLayout&) = delete;
    EditableLayout& operator=(const EditableLayout&) = delete;

    // =========================================================================
    // Content and Configuration
    // =========================================================================

    /**
     * Replace the displayed text. `spans` must cover `text` exactly; its
     * inline-object spans become the inline children, in order.
     */
    void setContent(std::u16string text, std::vector<text::Span> spans);

    void setStyle(const text::TextStyle& style);
    const text::TextStyle& style() const { return style_; }

    /**
     * @throws std::invalid_argument if the configuration is invalid
     */
    void setConfig(const EditableConfig& config);
    const EditableConfig& config() const { return config_; }

    void setSelection(const TextSelection& selection) { selection_ = selection; }
    const TextSelection& selection() const { return selection_; }

    void setHasFocus(bool hasFocus) { hasFocus_ = hasFocus; }
    bool hasFocus() const { return hasFocus_; }

    const std::u16string& plainText() const { return painter_.text(); }
    int textLength() const { return static_cast<int>(painter_.text().size()); }
    std::size_t childCount() const { return children_.size(); }

    text::TextLayoutEngine& textLayout() { return painter_; }
    const text::TextLayoutEngine& textLayout() const { return painter_; }

    // =========================================================================
    // Layout
    // =========================================================================

    void layout(const BoxConstraints& constraints);
    bool hasLayout() const { return hasLayout_; }
    const BoxConstraints& constraints() const { return constraints_; }
    Size size() const { return size_; }

    /**
     * False when an inline child uses a baseline-relative alignment; dry
     * layout and intrinsic sizes are then unavailable.
     */
    bool canComputeIntrinsics() const;

    /**
     * Size layout() would produce, without laying out children.
     * @return Size{} when unavailable
     */
    Size computeDryLayout(const BoxConstraints& constraints);

    // Intrinsic sizes return 0 when unavailable
    float computeMinIntrinsicWidth(float height);
    float computeMaxIntrinsicWidth(float height);
    float computeMinIntrinsicHeight(float width);
    float computeMaxIntrinsicHeight(float width);

    float computeDistanceToActualBaseline(text::TextBaseline baseline);

    /**
     * Height of one line of the base style. Valid without layout.
     */
    float preferredLineHeight() const { return painter_.preferredLineHeight(); }

    float caretMargin() const { return kCaretGap + config_.cursorWidth; }
    float cursorHeight() const { return config_.cursorHeight.value_or(preferredLineHeight()); }
    const Rect& caretPrototype() const { return caretPrototype_; }

    const std::vector<ChildPlacement>& childPlacements() const { return childPlacements_; }

    // =========================================================================
    // Scrolling
    // =========================================================================

    bool isMultiline() const { return config_.isMultiline(); }
    Axis viewportAxis() const { return isMultiline() ? Axis::Vertical : Axis::Horizontal; }
    float viewportExtent() const;

    /**
     * Set the scroll position along the viewport axis. Clamped to
     * [0, maxScrollExtent()] once laid out.
     */
    void setScrollOffset(float pixels);
    float scrollOffset() const { return scrollOffset_; }
    float maxScrollExtent() const { return maxScrollExtent_; }

    /**
     * Translation from text coordinates to local coordinates.
     */
    Point2 paintOffset() const;
    bool hasVisualOverflow() const;

    // =========================================================================
    // Geometry (valid after layout)
    // =========================================================================

    /**
     * Caret top-left in text coordinates.
     */
    Point2 getOffsetForCaret(TextPosition position, const Rect& caretPrototype);
    std::optional<float> getFullHeightForCaret(TextPosition position, const Rect& caretPrototype);

    /**
     * Selection boxes in text coordinates.
     */
    std::vector<text::TextBox> getBoxesForSelection(
        const TextSelection& selection,
        text::BoxHeightStyle heightStyle = text::BoxHeightStyle::Tight,
        text::BoxWidthStyle widthStyle = text::BoxWidthStyle::Tight
    );

    /**
     * Caret rect in local coordinates, cursorWidth x cursorHeight (no
     * prototype padding), snapped to physical pixels.
     */
    Rect getLocalRectForCaret(TextPosition position);

    /**
     * Text position under a local point.
     */
    TextPosition getPositionForPoint(Point2 local);

    /**
     * Text position under a point in text coordinates.
     */
    TextPosition getPositionForOffset(Point2 textOffset);

    /**
     * One point for a collapsed selection (bottom of the caret), two for a
     * ranged one (bottom of the first and last boxes). Local coordinates.
     */
    std::vector<SelectionPoint> getEndpointsForSelection(const TextSelection& selection);

    /**
     * Union of the boxes of `range` in local coordinates.
     * @return std::nullopt for an invalid or collapsed range
     */
    std::optional<Rect> getRectForComposingRange(TextRange range);

    TextRange getWordBoundary(TextPosition position);
    TextRange getLineBoundary(TextPosition position);
    std::optional<int> getOffsetAfter(int offset);
    std::optional<int> getOffsetBefore(int offset);

    /**
     * Index of the inline child under a local point; the child's own hit
     * test decides within its box.
     */
    std::optional<std::size_t> hitTestChildren(Point2 local) const;

    /**
     * Offset that moves `local` onto the physical pixel grid.
     */
    Point2 snapToPhysicalPixel(Point2 local) const;

    // =========================================================================
    // Selection Visibility
    // =========================================================================

    /**
     * Recompute whether the selection ends lie inside the viewport, for a
     * paint at `effectiveOffset` (paint origin plus paintOffset()).
     */
    void updateSelectionExtentsVisibility(Point2 effectiveOffset);
    bool selectionStartInViewport() const { return selectionStartInViewport_; }
    bool selectionEndInViewport() const { return selectionEndInViewport_; }

    // =========================================================================
    // Floating Cursor (editable_floating_cursor.cpp)
    // =========================================================================

    /**
     * Clamp a raw floating-cursor offset (text coordinates) to the content
     * bounds plus floatingCursorAddedMargin. After the raw offset left an
     * edge, moving back toward the content re-anchors the drag so the
     * cursor tracks immediately instead of waiting for the pointer to return.
     */
    Point2 calculateBoundedFloatingCursorOffset(Point2 rawCursorOffset);

    /**
     * @param resetLerpValue Progress of the snap-back animation; the regular
     *        caret is hidden while it is set
     */
    void setFloatingCursor(
        FloatingCursorDragState state,
        Point2 boundedOffset,
        TextPosition lastTextPosition,
        std::optional<float> resetLerpValue = std::nullopt
    );

    bool floatingCursorOn() const { return floatingCursorOn_; }
    const std::optional<Rect>& floatingCursorRect() const { return floatingCursorRect_; }
    TextPosition floatingCursorTextPosition() const { return floatingCursorTextPosition_; }
    bool showRegularCaret() const { return showRegularCaret_; }

private:
    std::vector<text::PlaceholderDimensions> layoutChildren(const BoxConstraints& constraints, bool dry);
    void applyBaselineFallback(std::vector<text::PlaceholderDimensions>& dimensions);
    void setIntrinsicDimensions(bool useMaxWidths);
    void setDryHeightDimensions(float width);
    void placeChildren();
    void computeCaretPrototype();

    // Lay the paragraph out for an editable of the given width, leaving room for the caret
    void layoutText(float minWidth, float maxWidth);
    void restorePlaceholderDimensions();
    // Restore full-layout placeholder sizes and lay out for the current constraints
    void ensureTextLayout();

    float preferredHeight(float width, bool fullLayout);
    float computeMaxScrollExtent(Size contentSize) const;

    text::TextLayoutEngine painter_;
    EditableConfig config_;
    text::TextStyle style_;

    std::vector<text::InlineObjectSpan> children_;
    std::vector<text::PlaceholderDimensions> placeholderDimensions_;
    std::vector<ChildPlacement> childPlacements_;
    bool dimensionsCurrent_ = false;

    BoxConstraints constraints_;
    bool hasLayout_ = false;
    Size size_;
    Size contentSize_;
    Rect caretPrototype_;
    float scrollOffset_ = 0.0f;
    float maxScrollExtent_ = 0.0f;

    TextSelection selection_;
    bool hasFocus_ = false;
    bool selectionStartInViewport_ = true;
    bool selectionEndInViewport_ = true;

    // Floating cursor
    Point2 relativeOrigin_;
    std::optional<Point2> previousOffset_;
    bool resetOriginOnLeft_ = false;
    bool resetOriginOnRight_ = false;
    bool resetOriginOnTop_ = false;
    bool resetOriginOnBottom_ = false;
    std::optional<float> resetFloatingCursorAnimationValue_;
    bool floatingCursorOn_ = false;
    TextPosition floatingCursorTextPosition_;
    std::optional<Rect> floatingCursorRect_;
    bool showRegularCaret_ = true;
};

} // namespace richedit::render

#endif // RICHEDIT_RENDER_EDITABLE_LAYOUT_H
