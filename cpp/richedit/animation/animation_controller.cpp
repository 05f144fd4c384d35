#include "richedit/animation/animation_controller.h"

#include "richedit/core/util.h"

namespace richedit::animation {

void AnimationController::animateTo(float target, double durationMs, Curve curve, double nowMs) {
    from_ = value_;
    target_ = target;
    startMs_ = nowMs;
    durationMs_ = durationMs;
    curve_ = curve;
    completed_ = false;
    animating_ = true;
    if (durationMs_ <= 0.0) {
        tick(nowMs);
    }
}

void AnimationController::setValue(float value) {
    animating_ = false;
    completed_ = false;
    value_ = value;
}

bool AnimationController::tick(double nowMs) {
    if (!animating_) {
        return false;
    }
    const float previous = value_;
    const double elapsed = nowMs - startMs_;
    if (durationMs_ <= 0.0 || elapsed >= durationMs_) {
        value_ = target_;
        animating_ = false;
        completed_ = true;
    } else {
        const float t = static_cast<float>(elapsed / durationMs_);
        value_ = lerpF(from_, target_, applyCurve(curve_, t));
    }
    return value_ != previous;
}

} // namespace richedit::animation
