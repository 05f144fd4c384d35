#include "richedit/render/editable_layout.h"

#include "richedit/core/util.h"

#include <algorithm>

namespace richedit::render {

Point2 EditableLayout::calculateBoundedFloatingCursorOffset(Point2 rawCursorOffset) {
    const EdgeInsets& margin = config_.floatingCursorAddedMargin;
    const float topBound = -margin.top;
    const float bottomBound = painter_.height() - preferredLineHeight() + margin.bottom;
    const float leftBound = -margin.left;
    const float rightBound = painter_.width() + margin.right;

    Point2 delta{};
    if (previousOffset_) {
        delta = rawCursorOffset - *previousOffset_;
    }

    // Moving back in after leaving an edge: re-anchor on that edge
    if (resetOriginOnLeft_ && delta.x > 0.0f) {
        relativeOrigin_.x = rawCursorOffset.x - leftBound;
        resetOriginOnLeft_ = false;
    } else if (resetOriginOnRight_ && delta.x < 0.0f) {
        relativeOrigin_.x = rawCursorOffset.x - rightBound;
        resetOriginOnRight_ = false;
    }
    if (resetOriginOnTop_ && delta.y > 0.0f) {
        relativeOrigin_.y = rawCursorOffset.y - topBound;
        resetOriginOnTop_ = false;
    } else if (resetOriginOnBottom_ && delta.y < 0.0f) {
        relativeOrigin_.y = rawCursorOffset.y - bottomBound;
        resetOriginOnBottom_ = false;
    }

    const float currentX = rawCursorOffset.x - relativeOrigin_.x;
    const float currentY = rawCursorOffset.y - relativeOrigin_.y;
    const Point2 adjusted{
        std::min(std::max(currentX, leftBound), rightBound),
        std::min(std::max(currentY, topBound), bottomBound),
    };

    if (currentX < leftBound && delta.x < 0.0f) {
        resetOriginOnLeft_ = true;
    } else if (currentX > rightBound && delta.x > 0.0f) {
        resetOriginOnRight_ = true;
    }
    if (currentY < topBound && delta.y < 0.0f) {
        resetOriginOnTop_ = true;
    } else if (currentY > bottomBound && delta.y > 0.0f) {
        resetOriginOnBottom_ = true;
    }

    previousOffset_ = rawCursorOffset;
    return adjusted;
}

void EditableLayout::setFloatingCursor(
    FloatingCursorDragState state,
    Point2 boundedOffset,
    TextPosition lastTextPosition,
    std::optional<float> resetLerpValue
) {
    if (state == FloatingCursorDragState::Start) {
        relativeOrigin_ = Point2{};
        previousOffset_.reset();
        resetOriginOnLeft_ = false;
        resetOriginOnRight_ = false;
        resetOriginOnTop_ = false;
        resetOriginOnBottom_ = false;
    }
    floatingCursorOn_ = state != FloatingCursorDragState::End;
    resetFloatingCursorAnimationValue_ = resetLerpValue;

    if (floatingCursorOn_) {
        floatingCursorTextPosition_ = lastTextPosition;
        // The growth shrinks to nothing while snapping back
        const float t = resetLerpValue.value_or(0.0f);
        const EdgeInsets sizeAdjustment{
            lerpF(kFloatingCaretSizeIncrease.left, 0.0f, t),
            lerpF(kFloatingCaretSizeIncrease.top, 0.0f, t),
            lerpF(kFloatingCaretSizeIncrease.right, 0.0f, t),
            lerpF(kFloatingCaretSizeIncrease.bottom, 0.0f, t),
        };
        floatingCursorRect_ = sizeAdjustment.inflateRect(caretPrototype_).shift(boundedOffset);
    } else {
        floatingCursorRect_.reset();
    }
    showRegularCaret_ = !resetFloatingCursorAnimationValue_.has_value();
}

} // namespace richedit::render
