#include "richedit/animation/floating_cursor.h"

#include "richedit/core/logging.h"
#include "richedit/core/util.h"

namespace richedit::animation {

using render::FloatingCursorDragState;
using text::TextPosition;

FloatingCursorAnimator::FloatingCursorAnimator(render::EditableLayout& layout, FloatingCursorConfig config)
    : layout_(layout), config_(config) {}

Point2 FloatingCursorAnimator::anchorOffset() const {
    return Point2{0.0f, layout_.preferredLineHeight() / 2.0f};
}

void FloatingCursorAnimator::update(const RawFloatingCursorPoint& point, double nowMs) {
    switch (point.state) {
        case FloatingCursorDragState::Start: {
            if (reset_.isAnimating()) {
                reset_.stop();
                onResetTick();
            }
            const int baseOffset = layout_.selection().baseOffset;
            if (baseOffset < 0) {
                RICHEDIT_LOG_DEBUG("floating cursor start ignored: no selection");
                return;
            }
            const TextPosition current{baseOffset};
            startCaretRect_ = layout_.getLocalRectForCaret(current);
            pointOffsetOrigin_.reset();
            lastBoundedOffset_.reset();
            lastTextPosition_.reset();
            layout_.setFloatingCursor(point.state, startCaretRect_->center() - anchorOffset(), current);
            break;
        }
        case FloatingCursorDragState::Update: {
            if (!startCaretRect_ || !point.offset) {
                return;
            }
            if (!pointOffsetOrigin_) {
                pointOffsetOrigin_ = point.offset;
                return;
            }
            const Point2 centered = *point.offset - *pointOffsetOrigin_;
            const Point2 raw = startCaretRect_->center() + centered - anchorOffset();
            lastBoundedOffset_ = layout_.calculateBoundedFloatingCursorOffset(raw);
            lastTextPosition_ = layout_.getPositionForPoint(*lastBoundedOffset_ + anchorOffset());
            layout_.setFloatingCursor(point.state, *lastBoundedOffset_, *lastTextPosition_);
            break;
        }
        case FloatingCursorDragState::End:
            if (lastTextPosition_ && lastBoundedOffset_) {
                reset_.setValue(0.0f);
                reset_.animateTo(1.0f, config_.resetDurationMs, config_.resetCurve, nowMs);
                onResetTick();
            } else {
                // Released without moving
                layout_.setFloatingCursor(FloatingCursorDragState::End, Point2{}, layout_.floatingCursorTextPosition());
                startCaretRect_.reset();
                pointOffsetOrigin_.reset();
            }
            break;
    }
}

bool FloatingCursorAnimator::advance(double nowMs) {
    if (!reset_.isAnimating()) {
        return false;
    }
    reset_.tick(nowMs);
    onResetTick();
    return true;
}

void FloatingCursorAnimator::onResetTick() {
    if (!lastTextPosition_ || !lastBoundedOffset_) {
        return;
    }
    const Point2 finalPosition = layout_.getLocalRectForCaret(*lastTextPosition_).centerLeft() - anchorOffset();
    if (reset_.isCompleted()) {
        const TextPosition position = *lastTextPosition_;
        layout_.setFloatingCursor(FloatingCursorDragState::End, finalPosition, position);
        startCaretRect_.reset();
        lastTextPosition_.reset();
        pointOffsetOrigin_.reset();
        lastBoundedOffset_.reset();
        if (position.offset != layout_.selection().baseOffset && onCommit_) {
            onCommit_(position);
        }
        return;
    }
    const float t = reset_.value();
    const Point2 lerped{
        lerpF(lastBoundedOffset_->x, finalPosition.x, t),
        lerpF(lastBoundedOffset_->y, finalPosition.y, t),
    };
    layout_.setFloatingCursor(FloatingCursorDragState::Update, lerped, *lastTextPosition_, t);
}

} // namespace richedit::animation
