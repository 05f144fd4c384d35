#include "richedit/animation/caret_blink.h"

namespace richedit::animation {

CaretBlink::CaretBlink(CaretBlinkConfig config) : config_(config) {}

void CaretBlink::start(double nowMs) {
    targetVisible_ = true;
    opacity_.setValue(1.0f);
    running_ = true;
    nextTickMs_.reset();
    waitingForStart_ = false;
    if (config_.deterministic) {
        return;
    }
    if (config_.opacityAnimates) {
        waitingForStart_ = true;
        nextTickMs_ = nowMs + config_.waitForStartMs;
    } else {
        nextTickMs_ = nowMs + config_.halfPeriodMs;
    }
}

void CaretBlink::stop(bool resetCharTicks) {
    running_ = false;
    nextTickMs_.reset();
    waitingForStart_ = false;
    targetVisible_ = false;
    opacity_.setValue(0.0f);
    if (config_.deterministic) {
        return;
    }
    if (resetCharTicks) {
        obscureShowCharTicksPending_ = 0;
    }
}

void CaretBlink::restart(double nowMs) {
    stop(false);
    start(nowMs);
}

void CaretBlink::tick(double nowMs) {
    targetVisible_ = !targetVisible_;
    const float target = targetVisible_ ? 1.0f : 0.0f;
    if (config_.opacityAnimates) {
        opacity_.animateTo(target, config_.fadeDurationMs, Curve::EaseOut, nowMs);
    } else {
        opacity_.setValue(target);
    }
    if (obscureShowCharTicksPending_ > 0) {
        --obscureShowCharTicksPending_;
    }
}

bool CaretBlink::advance(double nowMs) {
    const float opacityBefore = opacity_.value();
    const int ticksBefore = obscureShowCharTicksPending_;

    while (nextTickMs_ && *nextTickMs_ <= nowMs) {
        const double due = *nextTickMs_;
        if (waitingForStart_) {
            // The wait only delays the periodic timer; it does not toggle
            waitingForStart_ = false;
        } else {
            tick(due);
        }
        nextTickMs_ = due + config_.halfPeriodMs;
    }
    opacity_.tick(nowMs);

    return opacity_.value() != opacityBefore || obscureShowCharTicksPending_ != ticksBefore;
}

} // namespace richedit::animation
