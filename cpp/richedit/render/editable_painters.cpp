#include "richedit/render/editable_painters.h"

#include <algorithm>

namespace richedit::render {

namespace {

constexpr float kFloatingCaretOpacity = 0.75f;

Rect intersect(const Rect& a, const Rect& b) {
    return Rect{std::max(a.left, b.left), std::max(a.top, b.top), std::min(a.right, b.right), std::min(a.bottom, b.bottom)};
}

// Forwards to the host canvas with every coordinate shifted by a paint origin.
class OffsetCanvas final : public Canvas {
public:
    OffsetCanvas(Canvas& target, Point2 origin) : target_(target), origin_(origin) {}

    void drawRect(const Rect& rect, const Color& color) override {
        target_.drawRect(rect.shift(origin_), color);
    }
    void drawRoundedRect(const Rect& rect, float radius, const Color& color) override {
        target_.drawRoundedRect(rect.shift(origin_), radius, color);
    }
    void pushClipRect(const Rect& rect) override { target_.pushClipRect(rect.shift(origin_)); }
    void popClip() override { target_.popClip(); }
    void drawParagraph(const text::TextLayoutEngine& paragraph, Point2 offset) override {
        target_.drawParagraph(paragraph, offset + origin_);
    }
    void drawInlineContent(text::InlineContent* content, Point2 offset, float scale) override {
        target_.drawInlineContent(content, offset + origin_, scale);
    }

private:
    Canvas& target_;
    Point2 origin_;
};

} // namespace

// ============================================================================
// CompositePainter
// ============================================================================

CompositePainter::CompositePainter(std::vector<std::shared_ptr<EditablePainter>> painters)
    : painters_(std::move(painters)) {}

void CompositePainter::paint(Canvas& canvas, Size size, EditableLayout& layout) {
    for (const auto& painter : painters_) {
        if (painter) painter->paint(canvas, size, layout);
    }
}

bool CompositePainter::shouldRepaint(const EditablePainter* oldPainter) const {
    const auto* old = dynamic_cast<const CompositePainter*>(oldPainter);
    if (old == this) return false;
    if (!old || old->painters_.size() != painters_.size()) return true;
    for (std::size_t i = 0; i < painters_.size(); ++i) {
        if (!painters_[i] || !old->painters_[i]) {
            if (painters_[i] != old->painters_[i]) return true;
            continue;
        }
        if (painters_[i]->shouldRepaint(old->painters_[i].get())) return true;
    }
    return false;
}

// ============================================================================
// TextHighlightPainter
// ============================================================================

TextHighlightPainter::TextHighlightPainter(std::optional<TextRange> range, std::optional<Color> color)
    : range_(range), color_(color) {}

void TextHighlightPainter::setHighlightedRange(std::optional<TextRange> range) {
    if (range_ == range) return;
    range_ = range;
    notifyListeners();
}

void TextHighlightPainter::setHighlightColor(std::optional<Color> color) {
    if (color_ == color) return;
    color_ = color;
    notifyListeners();
}

void TextHighlightPainter::setSelectionHeightStyle(text::BoxHeightStyle style) {
    if (heightStyle_ == style) return;
    heightStyle_ = style;
    notifyListeners();
}

void TextHighlightPainter::setSelectionWidthStyle(text::BoxWidthStyle style) {
    if (widthStyle_ == style) return;
    widthStyle_ = style;
    notifyListeners();
}

void TextHighlightPainter::paint(Canvas& canvas, Size size, EditableLayout& layout) {
    (void)size;
    if (!range_ || !color_ || !range_->isValid() || range_->isCollapsed()) {
        return;
    }
    const TextSelection selection{range_->start, range_->end};
    const std::vector<text::TextBox> boxes = layout.getBoxesForSelection(selection, heightStyle_, widthStyle_);
    const Rect textBounds = Rect::fromLTWH(0.0f, 0.0f, layout.textLayout().width(), layout.textLayout().height());
    const Point2 paintOffset = layout.paintOffset();
    for (const text::TextBox& box : boxes) {
        canvas.drawRect(intersect(box.toRect(), textBounds).shift(paintOffset), *color_);
    }
}

bool TextHighlightPainter::shouldRepaint(const EditablePainter* oldPainter) const {
    const auto* old = dynamic_cast<const TextHighlightPainter*>(oldPainter);
    if (old == this) return false;
    if (!old) return true;
    return old->range_ != range_ || old->color_ != color_ ||
           old->heightStyle_ != heightStyle_ || old->widthStyle_ != widthStyle_;
}

// ============================================================================
// CaretPainter
// ============================================================================

void CaretPainter::setShouldPaint(bool shouldPaint) {
    if (shouldPaint_ == shouldPaint) return;
    shouldPaint_ = shouldPaint;
    notifyListeners();
}

void CaretPainter::setCaretColor(std::optional<Color> color) {
    if (caretColor_ == color) return;
    caretColor_ = color;
    notifyListeners();
}

void CaretPainter::setCursorRadius(std::optional<float> radius) {
    if (cursorRadius_ == radius) return;
    cursorRadius_ = radius;
    notifyListeners();
}

void CaretPainter::setCursorOffset(Point2 offset) {
    if (cursorOffset_ == offset) return;
    cursorOffset_ = offset;
    notifyListeners();
}

void CaretPainter::setBackgroundCursorColor(std::optional<Color> color) {
    if (backgroundCursorColor_ == color) return;
    backgroundCursorColor_ = color;
    notifyListeners();
}

void CaretPainter::paintRegularCaret(Canvas& canvas, EditableLayout& layout, const Color& color, TextPosition position) {
    const Rect& prototype = layout.caretPrototype();
    const Point2 caretOffset = layout.getOffsetForCaret(position, prototype) + cursorOffset_;
    Rect caretRect = prototype.shift(caretOffset);

    if (const std::optional<float> fullHeight = layout.getFullHeightForCaret(position, prototype)) {
        switch (layout.config().caretStyle) {
            case CaretStyle::Tall: {
                // Centered on the glyph
                const float heightDiff = *fullHeight - caretRect.height();
                caretRect = Rect::fromLTWH(caretRect.left, caretRect.top + heightDiff / 2.0f,
                                           caretRect.width(), caretRect.height());
                break;
            }
            case CaretStyle::Inset:
                caretRect = Rect::fromLTWH(caretRect.left, caretRect.top - kCaretHeightOffset,
                                           caretRect.width(), *fullHeight);
                break;
        }
    }

    caretRect = caretRect.shift(layout.paintOffset());
    const Rect integralRect = caretRect.shift(layout.snapToPhysicalPixel(caretRect.topLeft()));

    if (cursorRadius_) {
        canvas.drawRoundedRect(integralRect, *cursorRadius_, color);
    } else {
        canvas.drawRect(integralRect, color);
    }
    if (onCaretPainted_) {
        onCaretPainted_(integralRect);
    }
}

void CaretPainter::paint(Canvas& canvas, Size size, EditableLayout& layout) {
    (void)size;
    const TextSelection& selection = layout.selection();
    if (!shouldPaint_ || !selection.isValid() || !selection.isCollapsed()) {
        return;
    }

    const std::optional<Rect>& floatingRect = layout.floatingCursorRect();
    std::optional<Color> regularColor = caretColor_;
    if (floatingRect) {
        regularColor = layout.showRegularCaret() ? backgroundCursorColor_ : std::nullopt;
    }
    const TextPosition position = floatingRect ? layout.floatingCursorTextPosition() : selection.extent();
    if (regularColor) {
        paintRegularCaret(canvas, layout, *regularColor, position);
    }

    if (!floatingRect || !caretColor_) {
        return;
    }
    canvas.drawRoundedRect(floatingRect->shift(layout.paintOffset()), kFloatingCaretRadius,
                           caretColor_->withOpacity(kFloatingCaretOpacity));
}

bool CaretPainter::shouldRepaint(const EditablePainter* oldPainter) const {
    const auto* old = dynamic_cast<const CaretPainter*>(oldPainter);
    if (old == this) return false;
    if (!old) return true;
    return old->shouldPaint_ != shouldPaint_ || old->caretColor_ != caretColor_ ||
           old->cursorRadius_ != cursorRadius_ || old->cursorOffset_ != cursorOffset_ ||
           old->backgroundCursorColor_ != backgroundCursorColor_;
}

// ============================================================================
// Editable
// ============================================================================

void paintEditable(
    Canvas& canvas,
    Point2 offset,
    EditableLayout& layout,
    EditablePainter* background,
    EditablePainter* foreground
) {
    const Size size = layout.size();
    const Point2 paintOffset = layout.paintOffset();
    layout.updateSelectionExtentsVisibility(offset + paintOffset);

    OffsetCanvas local(canvas, offset);
    if (background) {
        background->paint(local, size, layout);
    }

    const bool clip = layout.hasVisualOverflow();
    if (clip) {
        local.pushClipRect(Rect::fromLTWH(0.0f, 0.0f, size.width, size.height));
    }
    local.drawParagraph(layout.textLayout(), paintOffset);
    for (const ChildPlacement& child : layout.childPlacements()) {
        if (child.content) {
            local.drawInlineContent(child.content, paintOffset + child.offset, child.scale);
        }
    }
    if (clip) {
        local.popClip();
    }

    if (foreground) {
        foreground->paint(local, size, layout);
    }
}

} // namespace richedit::render
