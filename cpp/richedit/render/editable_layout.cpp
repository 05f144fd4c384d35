#include "richedit/render/editable_layout.h"

#include "richedit/core/logging.h"
#include "richedit/core/util.h"

#include <algorithm>
#include <cmath>

namespace richedit::render {

using text::PlaceholderAlignment;
using text::PlaceholderDimensions;

EditableLayout::EditableLayout(text::TextShaper* shaper, EditableConfig config)
    : painter_(shaper) {
    setConfig(config);
    computeCaretPrototype();
}

// =============================================================================
// Content and Configuration
// =============================================================================

void EditableLayout::setContent(std::u16string text, std::vector<text::Span> spans) {
    painter_.setText(std::move(text), std::move(spans));
    children_.clear();
    for (const text::InlineObjectSpan* span : text::inlineObjectSpans(painter_.spans())) {
        children_.push_back(*span);
    }
    placeholderDimensions_.clear();
    childPlacements_.clear();
    dimensionsCurrent_ = false;
}

void EditableLayout::setStyle(const text::TextStyle& style) {
    style_ = style;
    painter_.setStyle(style);
    computeCaretPrototype();
}

void EditableLayout::setConfig(const EditableConfig& config) {
    validateEditableConfig(config);
    config_ = config;
    painter_.setTextAlign(config.textAlign);
    painter_.setTextDirection(config.textDirection);
    painter_.setTextScaleFactor(config.textScaleFactor);
    dimensionsCurrent_ = false;
    computeCaretPrototype();
}

// =============================================================================
// Inline Children
// =============================================================================

bool EditableLayout::canComputeIntrinsics() const {
    for (const auto& child : children_) {
        if (text::requiresBaseline(child.alignment)) {
            return false;
        }
    }
    return true;
}

std::vector<PlaceholderDimensions> EditableLayout::layoutChildren(const BoxConstraints& constraints, bool dry) {
    std::vector<PlaceholderDimensions> dimensions;
    if (children_.empty()) {
        return dimensions;
    }
    dimensions.reserve(children_.size());

    // Children are painted scaled by textScaleFactor; shrink the constraint to match
    const float maxWidth = constraints.maxWidth / config_.textScaleFactor;
    bool needsBaselineFallback = false;
    for (const auto& child : children_) {
        PlaceholderDimensions d;
        d.alignment = child.alignment;
        d.baseline = child.baseline;
        if (child.content) {
            if (!dry) {
                d.size = child.content->layout(maxWidth);
                if (child.alignment == PlaceholderAlignment::Baseline) {
                    d.baselineOffset = child.content->distanceToBaseline(child.baseline);
                    needsBaselineFallback = needsBaselineFallback || !d.baselineOffset;
                }
            } else {
                d.size = child.content->dryLayout(maxWidth);
            }
        }
        dimensions.push_back(d);
    }

    if (needsBaselineFallback) {
        applyBaselineFallback(dimensions);
    }
    return dimensions;
}

void EditableLayout::applyBaselineFallback(std::vector<PlaceholderDimensions>& dimensions) {
    // Children without a baseline sit on the first line's descent
    painter_.setPlaceholderDimensions(dimensions);
    dimensionsCurrent_ = false;
    layoutText(constraints_.minWidth, constraints_.maxWidth);
    const std::vector<text::LineMetrics> metrics = painter_.computeLineMetrics();
    const float descent = metrics.empty() ? 0.0f : metrics.front().descent / config_.textScaleFactor;
    for (PlaceholderDimensions& d : dimensions) {
        if (d.alignment == PlaceholderAlignment::Baseline && !d.baselineOffset) {
            d.baselineOffset = d.size.height - descent;
        }
    }
}

void EditableLayout::setIntrinsicDimensions(bool useMaxWidths) {
    // Height is irrelevant here: the paragraph is laid out on unbounded width
    std::vector<PlaceholderDimensions> dimensions;
    dimensions.reserve(children_.size());
    for (const auto& child : children_) {
        PlaceholderDimensions d;
        d.alignment = child.alignment;
        d.baseline = child.baseline;
        if (child.content) {
            const float width = useMaxWidths ? child.content->maxIntrinsicWidth() : child.content->minIntrinsicWidth();
            d.size = Size{width, 0.0f};
        }
        dimensions.push_back(d);
    }
    painter_.setPlaceholderDimensions(std::move(dimensions));
    dimensionsCurrent_ = false;
}

void EditableLayout::setDryHeightDimensions(float width) {
    const float maxWidth = width / config_.textScaleFactor;
    std::vector<PlaceholderDimensions> dimensions;
    dimensions.reserve(children_.size());
    for (const auto& child : children_) {
        PlaceholderDimensions d;
        d.alignment = child.alignment;
        d.baseline = child.baseline;
        if (child.content) {
            d.size = child.content->dryLayout(maxWidth);
        }
        dimensions.push_back(d);
    }
    painter_.setPlaceholderDimensions(std::move(dimensions));
    dimensionsCurrent_ = false;
}

void EditableLayout::placeChildren() {
    childPlacements_.clear();
    const std::vector<text::TextBox> boxes = painter_.inlinePlaceholderBoxes();
    const std::size_t count = std::min(children_.size(), boxes.size());
    childPlacements_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const Size size = i < placeholderDimensions_.size() ? placeholderDimensions_[i].size : Size{};
        childPlacements_.push_back(ChildPlacement{
            children_[i].content,
            Point2{boxes[i].left, boxes[i].top},
            size,
            config_.textScaleFactor
        });
    }
}

// =============================================================================
// Layout
// =============================================================================

void EditableLayout::computeCaretPrototype() {
    const float width = config_.cursorWidth;
    const float height = cursorHeight();
    switch (config_.caretStyle) {
        case CaretStyle::Tall:
            caretPrototype_ = Rect::fromLTWH(0.0f, 0.0f, width, height + 2.0f);
            break;
        case CaretStyle::Inset:
            caretPrototype_ = Rect::fromLTWH(0.0f, kCaretHeightOffset, width, height - 2.0f * kCaretHeightOffset);
            break;
    }
}

void EditableLayout::layoutText(float minWidth, float maxWidth) {
    const float availableMaxWidth = std::max(0.0f, maxWidth - caretMargin());
    const float availableMinWidth = std::min(minWidth, availableMaxWidth);
    const float textMaxWidth = isMultiline() ? availableMaxWidth : text::TextLayoutEngine::kUnbounded;
    float textMinWidth = config_.forceLine ? availableMaxWidth : availableMinWidth;
    if (!std::isfinite(textMinWidth)) {
        textMinWidth = std::isfinite(availableMinWidth) ? availableMinWidth : 0.0f;
    }
    painter_.layout(textMinWidth, textMaxWidth);
}

void EditableLayout::restorePlaceholderDimensions() {
    if (!dimensionsCurrent_) {
        painter_.setPlaceholderDimensions(placeholderDimensions_);
        dimensionsCurrent_ = true;
    }
}

void EditableLayout::ensureTextLayout() {
    restorePlaceholderDimensions();
    layoutText(constraints_.minWidth, constraints_.maxWidth);
}

void EditableLayout::layout(const BoxConstraints& constraints) {
    constraints_ = constraints;
    placeholderDimensions_ = layoutChildren(constraints, false);
    dimensionsCurrent_ = false;
    ensureTextLayout();
    placeChildren();
    computeCaretPrototype();

    // Read the paragraph size before preferredHeight() lays it out again
    const Size textSize = painter_.size();
    float width = constraints.constrainWidth(textSize.width + caretMargin());
    if (config_.forceLine && std::isfinite(constraints.maxWidth)) {
        width = constraints.maxWidth;
    }
    size_ = Size{width, constraints.constrainHeight(preferredHeight(constraints.maxWidth, true))};
    contentSize_ = Size{textSize.width + caretMargin(), textSize.height};

    maxScrollExtent_ = computeMaxScrollExtent(contentSize_);
    scrollOffset_ = clampF(scrollOffset_, 0.0f, maxScrollExtent_);
    hasLayout_ = true;

    ensureTextLayout();
}

Size EditableLayout::computeDryLayout(const BoxConstraints& constraints) {
    if (!canComputeIntrinsics()) {
        RICHEDIT_LOG_DEBUG("dry layout unavailable: baseline-aligned inline object");
        return Size{};
    }
    painter_.setPlaceholderDimensions(layoutChildren(constraints, true));
    dimensionsCurrent_ = false;
    layoutText(constraints.minWidth, constraints.maxWidth);
    float width = constraints.constrainWidth(painter_.width() + caretMargin());
    if (config_.forceLine && std::isfinite(constraints.maxWidth)) {
        width = constraints.maxWidth;
    }
    return Size{width, constraints.constrainHeight(preferredHeight(constraints.maxWidth, false))};
}

float EditableLayout::computeMinIntrinsicWidth(float height) {
    (void)height;
    if (!canComputeIntrinsics()) {
        RICHEDIT_LOG_DEBUG("min intrinsic width unavailable: baseline-aligned inline object");
        return 0.0f;
    }
    setIntrinsicDimensions(true);
    layoutText(0.0f, text::TextLayoutEngine::kUnbounded);
    return painter_.minIntrinsicWidth();
}

float EditableLayout::computeMaxIntrinsicWidth(float height) {
    (void)height;
    if (!canComputeIntrinsics()) {
        RICHEDIT_LOG_DEBUG("max intrinsic width unavailable: baseline-aligned inline object");
        return 0.0f;
    }
    setIntrinsicDimensions(false);
    layoutText(0.0f, text::TextLayoutEngine::kUnbounded);
    return painter_.maxIntrinsicWidth() + config_.cursorWidth;
}

float EditableLayout::computeMinIntrinsicHeight(float width) {
    return preferredHeight(width, false);
}

float EditableLayout::computeMaxIntrinsicHeight(float width) {
    return preferredHeight(width, false);
}

float EditableLayout::computeDistanceToActualBaseline(text::TextBaseline baseline) {
    ensureTextLayout();
    return painter_.computeDistanceToActualBaseline(baseline);
}

float EditableLayout::preferredHeight(float width, bool fullLayout) {
    if (!fullLayout && !canComputeIntrinsics()) {
        RICHEDIT_LOG_DEBUG("intrinsic height unavailable: baseline-aligned inline object");
        return 0.0f;
    }
    const float lineHeight = preferredLineHeight();
    const std::optional<int>& maxLines = config_.maxLines;
    const std::optional<int>& minLines = config_.minLines;

    // Height locked to maxLines
    const bool lockedMax = maxLines && !minLines;
    const bool lockedBoth = minLines && maxLines && *minLines == *maxLines;
    const bool singleLine = maxLines && *maxLines == 1;
    if (singleLine || lockedMax || lockedBoth) {
        return lineHeight * static_cast<float>(*maxLines);
    }

    // Clamped to [minLines, maxLines]
    const bool minLimited = minLines && *minLines > 1;
    const bool maxLimited = maxLines.has_value();
    if (minLimited || maxLimited) {
        if (fullLayout) restorePlaceholderDimensions();
        layoutText(0.0f, width);
        if (minLimited && painter_.height() < lineHeight * static_cast<float>(*minLines)) {
            return lineHeight * static_cast<float>(*minLines);
        }
        if (maxLimited && painter_.height() > lineHeight * static_cast<float>(*maxLines)) {
            return lineHeight * static_cast<float>(*maxLines);
        }
    }

    // Unbounded width: only explicit line feeds start new lines
    if (!std::isfinite(width)) {
        const std::u16string& text = plainText();
        const auto lines = 1 + std::count(text.begin(), text.end(), u'\n');
        return lineHeight * static_cast<float>(lines);
    }

    if (fullLayout) {
        restorePlaceholderDimensions();
    } else {
        setDryHeightDimensions(width);
    }
    layoutText(0.0f, width);
    return std::max(lineHeight, painter_.height());
}

// =============================================================================
// Scrolling
// =============================================================================

float EditableLayout::viewportExtent() const {
    return viewportAxis() == Axis::Horizontal ? size_.width : size_.height;
}

float EditableLayout::computeMaxScrollExtent(Size contentSize) const {
    switch (viewportAxis()) {
        case Axis::Horizontal:
            return std::max(0.0f, contentSize.width - size_.width);
        case Axis::Vertical:
            return std::max(0.0f, contentSize.height - size_.height);
    }
    return 0.0f;
}

void EditableLayout::setScrollOffset(float pixels) {
    scrollOffset_ = hasLayout_ ? clampF(pixels, 0.0f, maxScrollExtent_) : pixels;
}

Point2 EditableLayout::paintOffset() const {
    return viewportAxis() == Axis::Horizontal ? Point2{-scrollOffset_, 0.0f} : Point2{0.0f, -scrollOffset_};
}

bool EditableLayout::hasVisualOverflow() const {
    return maxScrollExtent_ > 0.0f || paintOffset() != Point2{};
}

// =============================================================================
// Geometry
// =============================================================================

Point2 EditableLayout::getOffsetForCaret(TextPosition position, const Rect& caretPrototype) {
    ensureTextLayout();
    return painter_.getOffsetForCaret(position, caretPrototype);
}

std::optional<float> EditableLayout::getFullHeightForCaret(TextPosition position, const Rect& caretPrototype) {
    ensureTextLayout();
    return painter_.getFullHeightForCaret(position, caretPrototype);
}

std::vector<text::TextBox> EditableLayout::getBoxesForSelection(
    const TextSelection& selection,
    text::BoxHeightStyle heightStyle,
    text::BoxWidthStyle widthStyle
) {
    ensureTextLayout();
    return painter_.getBoxesForSelection(selection.range(), heightStyle, widthStyle);
}

Rect EditableLayout::getLocalRectForCaret(TextPosition position) {
    ensureTextLayout();
    const Point2 caretOffset = painter_.getOffsetForCaret(position, caretPrototype_);
    // Same as the caret prototype without its vertical padding
    const Rect rect = Rect::fromLTWH(0.0f, 0.0f, config_.cursorWidth, cursorHeight())
        .shift(caretOffset + paintOffset() + config_.cursorOffset);
    return rect.shift(snapToPhysicalPixel(rect.topLeft()));
}

TextPosition EditableLayout::getPositionForPoint(Point2 local) {
    ensureTextLayout();
    return painter_.getPositionForOffset(local - paintOffset());
}

TextPosition EditableLayout::getPositionForOffset(Point2 textOffset) {
    ensureTextLayout();
    return painter_.getPositionForOffset(textOffset);
}

std::vector<SelectionPoint> EditableLayout::getEndpointsForSelection(const TextSelection& selection) {
    ensureTextLayout();
    const Point2 offset = paintOffset();

    std::vector<text::TextBox> boxes;
    if (!selection.isCollapsed()) {
        boxes = painter_.getBoxesForSelection(selection.range());
    }
    if (boxes.empty()) {
        const Point2 caretOffset = painter_.getOffsetForCaret(selection.extent(), caretPrototype_);
        const Point2 start = Point2{0.0f, preferredLineHeight()} + caretOffset + offset;
        return {SelectionPoint{start, std::nullopt}};
    }
    const text::TextBox& first = boxes.front();
    const text::TextBox& last = boxes.back();
    return {
        SelectionPoint{Point2{first.start(), first.bottom} + offset, first.direction},
        SelectionPoint{Point2{last.end(), last.bottom} + offset, last.direction},
    };
}

std::optional<Rect> EditableLayout::getRectForComposingRange(TextRange range) {
    if (!range.isValid() || range.isCollapsed()) {
        return std::nullopt;
    }
    ensureTextLayout();
    const std::vector<text::TextBox> boxes = painter_.getBoxesForSelection(range);
    std::optional<Rect> result;
    for (const text::TextBox& box : boxes) {
        result = result ? result->expandToInclude(box.toRect()) : box.toRect();
    }
    if (result) {
        result = result->shift(paintOffset());
    }
    return result;
}

TextRange EditableLayout::getWordBoundary(TextPosition position) {
    ensureTextLayout();
    return painter_.getWordBoundary(position);
}

TextRange EditableLayout::getLineBoundary(TextPosition position) {
    ensureTextLayout();
    return painter_.getLineBoundary(position);
}

std::optional<int> EditableLayout::getOffsetAfter(int offset) {
    return painter_.getOffsetAfter(offset);
}

std::optional<int> EditableLayout::getOffsetBefore(int offset) {
    return painter_.getOffsetBefore(offset);
}

std::optional<std::size_t> EditableLayout::hitTestChildren(Point2 local) const {
    const Point2 p = local - paintOffset();
    for (std::size_t i = 0; i < childPlacements_.size(); ++i) {
        const ChildPlacement& child = childPlacements_[i];
        if (!child.content || child.scale <= 0.0f) continue;
        const Point2 transformed{(p.x - child.offset.x) / child.scale, (p.y - child.offset.y) / child.scale};
        if (!Rect::fromLTWH(0.0f, 0.0f, child.size.width, child.size.height).contains(transformed)) {
            continue;
        }
        if (child.content->hitTest(transformed)) {
            return i;
        }
    }
    return std::nullopt;
}

Point2 EditableLayout::snapToPhysicalPixel(Point2 local) const {
    const float pixelMultiple = 1.0f / config_.devicePixelRatio;
    return Point2{
        std::isfinite(local.x) ? std::round(local.x / pixelMultiple) * pixelMultiple - local.x : 0.0f,
        std::isfinite(local.y) ? std::round(local.y / pixelMultiple) * pixelMultiple - local.y : 0.0f,
    };
}

// =============================================================================
// Selection Visibility
// =============================================================================

void EditableLayout::updateSelectionExtentsVisibility(Point2 effectiveOffset) {
    if (!selection_.isValid()) {
        return;
    }
    ensureTextLayout();
    const Rect visibleRegion = Rect{0.0f, 0.0f, size_.width, size_.height}.inflate(kVisibleRegionSlop);

    const Point2 startOffset = painter_.getOffsetForCaret(
        TextPosition{selection_.start(), selection_.affinity}, caretPrototype_);
    selectionStartInViewport_ = visibleRegion.contains(startOffset + effectiveOffset);

    const Point2 endOffset = painter_.getOffsetForCaret(
        TextPosition{selection_.end(), selection_.affinity}, caretPrototype_);
    selectionEndInViewport_ = visibleRegion.contains(endOffset + effectiveOffset);
}

} // namespace richedit::render
