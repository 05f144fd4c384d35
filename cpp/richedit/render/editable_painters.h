#ifndef RICHEDIT_RENDER_EDITABLE_PAINTERS_H
#define RICHEDIT_RENDER_EDITABLE_PAINTERS_H

#include "richedit/core/types.h"
#include "richedit/editing/editing_value.h"
#include "richedit/render/editable_layout.h"
#include "richedit/text/inline_content.h"
#include "richedit/text/text_layout.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace richedit::render {

/**
 * Canvas: drawing surface supplied by the host.
 *
 * Only solid rects are required. Clips, text and inline content are
 * forwarded so a host can interleave them with highlight and caret layers;
 * the defaults ignore them.
 */
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void drawRect(const Rect& rect, const Color& color) = 0;
    virtual void drawRoundedRect(const Rect& rect, float radius, const Color& color) = 0;

    virtual void pushClipRect(const Rect& rect) { (void)rect; }
    virtual void popClip() {}

    virtual void drawParagraph(const text::TextLayoutEngine& paragraph, Point2 offset) {
        (void)paragraph;
        (void)offset;
    }
    virtual void drawInlineContent(text::InlineContent* content, Point2 offset, float scale) {
        (void)content;
        (void)offset;
        (void)scale;
    }
};

// ============================================================================
// Painters
// ============================================================================

/**
 * EditablePainter: one paint layer drawn under or over the text.
 *
 * Painters notify their repaint listener when a property that changes their
 * output is set. shouldRepaint() compares against the painter that was
 * installed before.
 */
class EditablePainter {
public:
    using RepaintListener = std::function<void()>;

    virtual ~EditablePainter() = default;

    /**
     * Paint in the editable's local coordinates.
     */
    virtual void paint(Canvas& canvas, Size size, EditableLayout& layout) = 0;
    virtual bool shouldRepaint(const EditablePainter* oldPainter) const = 0;

    void setRepaintListener(RepaintListener listener) { repaintListener_ = std::move(listener); }

protected:
    void notifyListeners() {
        if (repaintListener_) repaintListener_();
    }

private:
    RepaintListener repaintListener_;
};

/**
 * Paints a list of painters in order.
 */
class CompositePainter : public EditablePainter {
public:
    explicit CompositePainter(std::vector<std::shared_ptr<EditablePainter>> painters = {});

    void paint(Canvas& canvas, Size size, EditableLayout& layout) override;
    bool shouldRepaint(const EditablePainter* oldPainter) const override;

    const std::vector<std::shared_ptr<EditablePainter>>& painters() const { return painters_; }

private:
    std::vector<std::shared_ptr<EditablePainter>> painters_;
};

/**
 * Fills the boxes of a non-collapsed range. Used for the selection and for
 * the prompt rect.
 */
class TextHighlightPainter : public EditablePainter {
public:
    TextHighlightPainter() = default;
    TextHighlightPainter(std::optional<TextRange> range, std::optional<Color> color);

    void setHighlightedRange(std::optional<TextRange> range);
    const std::optional<TextRange>& highlightedRange() const { return range_; }

    void setHighlightColor(std::optional<Color> color);
    const std::optional<Color>& highlightColor() const { return color_; }

    void setSelectionHeightStyle(text::BoxHeightStyle style);
    void setSelectionWidthStyle(text::BoxWidthStyle style);
    text::BoxHeightStyle selectionHeightStyle() const { return heightStyle_; }
    text::BoxWidthStyle selectionWidthStyle() const { return widthStyle_; }

    void paint(Canvas& canvas, Size size, EditableLayout& layout) override;
    bool shouldRepaint(const EditablePainter* oldPainter) const override;

private:
    std::optional<TextRange> range_;
    std::optional<Color> color_;
    text::BoxHeightStyle heightStyle_ = text::BoxHeightStyle::Tight;
    text::BoxWidthStyle widthStyle_ = text::BoxWidthStyle::Tight;
};

/**
 * Paints the regular caret and, while a floating-cursor drag is on, the
 * floating caret. Paints nothing unless the selection is valid and collapsed.
 *
 * While the floating caret is shown the regular caret is drawn in
 * backgroundCursorColor (or not at all when that is unset).
 */
class CaretPainter : public EditablePainter {
public:
    using CaretPaintedCallback = std::function<void(const Rect&)>;

    CaretPainter() = default;

    void setShouldPaint(bool shouldPaint);
    bool shouldPaint() const { return shouldPaint_; }

    void setCaretColor(std::optional<Color> color);
    const std::optional<Color>& caretColor() const { return caretColor_; }

    void setCursorRadius(std::optional<float> radius);
    void setCursorOffset(Point2 offset);
    void setBackgroundCursorColor(std::optional<Color> color);

    /**
     * Called with the local rect of every regular caret painted.
     */
    void setOnCaretPainted(CaretPaintedCallback callback) { onCaretPainted_ = std::move(callback); }

    void paint(Canvas& canvas, Size size, EditableLayout& layout) override;
    bool shouldRepaint(const EditablePainter* oldPainter) const override;

private:
    void paintRegularCaret(Canvas& canvas, EditableLayout& layout, const Color& color, TextPosition position);

    bool shouldPaint_ = true;
    std::optional<Color> caretColor_;
    std::optional<float> cursorRadius_;
    Point2 cursorOffset_;
    std::optional<Color> backgroundCursorColor_;
    CaretPaintedCallback onCaretPainted_;
};

/**
 * Paint one editable at `offset`: background painters, the paragraph and
 * inline children (clipped to the editable when it overflows), then the
 * foreground painters.
 */
void paintEditable(
    Canvas& canvas,
    Point2 offset,
    EditableLayout& layout,
    EditablePainter* background,
    EditablePainter* foreground
);

} // namespace richedit::render

#endif // RICHEDIT_RENDER_EDITABLE_PAINTERS_H
