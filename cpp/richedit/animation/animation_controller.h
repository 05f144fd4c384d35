#ifndef RICHEDIT_ANIMATION_CONTROLLER_H
#define RICHEDIT_ANIMATION_CONTROLLER_H

#include "richedit/animation/curves.h"

namespace richedit::animation {

/**
 * AnimationController: a value animated toward a target over a duration.
 *
 * Time is supplied by the host (milliseconds, monotonic). Nothing moves
 * between tick() calls. Starting a new animation replaces the running one.
 */
class AnimationController {
public:
    AnimationController() = default;
    explicit AnimationController(float value) : value_(value) {}

    /**
     * Animate from the current value to `target`.
     */
    void animateTo(float target, double durationMs, Curve curve, double nowMs);

    /**
     * Jump to `value`, stopping any running animation.
     */
    void setValue(float value);
    void stop() { animating_ = false; }

    /**
     * Advance to `nowMs`.
     * @return True if the value changed
     */
    bool tick(double nowMs);

    float value() const { return value_; }
    bool isAnimating() const { return animating_; }

    /**
     * True once an animation ran to its target (cleared by setValue/animateTo).
     */
    bool isCompleted() const { return completed_; }

private:
    float value_ = 0.0f;
    float from_ = 0.0f;
    float target_ = 0.0f;
    double startMs_ = 0.0;
    double durationMs_ = 0.0;
    Curve curve_ = Curve::Linear;
    bool animating_ = false;
    bool completed_ = false;
};

} // namespace richedit::animation

#endif // RICHEDIT_ANIMATION_CONTROLLER_H
