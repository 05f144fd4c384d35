#ifndef RICHEDIT_ANIMATION_FLOATING_CURSOR_H
#define RICHEDIT_ANIMATION_FLOATING_CURSOR_H

#include "richedit/animation/animation_controller.h"
#include "richedit/core/types.h"
#include "richedit/render/editable_layout.h"
#include <functional>
#include <optional>

namespace richedit::animation {

struct FloatingCursorConfig {
    double resetDurationMs = 125.0;
    Curve resetCurve = Curve::Decelerate;
};

// One floating-cursor event from the platform. `offset` is the pointer
// position, required for Update.
struct RawFloatingCursorPoint {
    std::optional<Point2> offset;
    render::FloatingCursorDragState state = render::FloatingCursorDragState::Start;
};

/**
 * FloatingCursorAnimator: drives the floating cursor of one editable.
 *
 * - Start anchors on the caret at the selection base
 * - The first Update only records the pointer origin; later ones move the
 *   cursor by the pointer delta, clamped by the layout
 * - End snaps back to the caret of the last hovered position over
 *   resetDurationMs, then reports that position if it differs from the base
 *
 * Offsets handed to the layout are the caret's top-left; pointer deltas are
 * applied to the caret center, hence the half-line anchor offset.
 */
class FloatingCursorAnimator {
public:
    using CommitHandler = std::function<void(text::TextPosition)>;

    explicit FloatingCursorAnimator(render::EditableLayout& layout, FloatingCursorConfig config = FloatingCursorConfig{});

    void setOnCommit(CommitHandler handler) { onCommit_ = std::move(handler); }

    void update(const RawFloatingCursorPoint& point, double nowMs);

    /**
     * Advance the snap-back animation.
     * @return True while the animation moved the cursor
     */
    bool advance(double nowMs);

    bool isResetting() const { return reset_.isAnimating(); }
    bool isActive() const { return startCaretRect_.has_value(); }
    std::optional<text::TextPosition> lastTextPosition() const { return lastTextPosition_; }
    std::optional<Point2> lastBoundedOffset() const { return lastBoundedOffset_; }

private:
    Point2 anchorOffset() const;
    void onResetTick();

    render::EditableLayout& layout_;
    FloatingCursorConfig config_;
    AnimationController reset_;
    CommitHandler onCommit_;

    std::optional<Rect> startCaretRect_;
    std::optional<Point2> pointOffsetOrigin_;
    std::optional<Point2> lastBoundedOffset_;
    std::optional<text::TextPosition> lastTextPosition_;
};

} // namespace richedit::animation

#endif // RICHEDIT_ANIMATION_FLOATING_CURSOR_H
