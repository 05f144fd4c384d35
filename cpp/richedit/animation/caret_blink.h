#ifndef RICHEDIT_ANIMATION_CARET_BLINK_H
#define RICHEDIT_ANIMATION_CARET_BLINK_H

#include "richedit/animation/animation_controller.h"
#include <optional>

namespace richedit::animation {

struct CaretBlinkConfig {
    double halfPeriodMs = 500.0;
    double waitForStartMs = 150.0;  // Before the first toggle, when opacity animates
    double fadeDurationMs = 250.0;
    bool opacityAnimates = false;
    // Never schedule ticks; the caret stays at its start/stop opacity
    bool deterministic = false;
};

/**
 * CaretBlink: the caret's blink timer and opacity.
 *
 * Host-driven: advance(nowMs) fires the ticks that are due and moves the
 * fade. At most one timer is pending; start() replaces it.
 *
 * Each tick also counts down the obscured-text "show latest character"
 * ticks.
 */
class CaretBlink {
public:
    explicit CaretBlink(CaretBlinkConfig config = CaretBlinkConfig{});

    const CaretBlinkConfig& config() const { return config_; }
    void setConfig(const CaretBlinkConfig& config) { config_ = config; }

    /**
     * Show the caret at full opacity and schedule ticks.
     */
    void start(double nowMs);

    /**
     * Hide the caret and cancel ticks.
     * @param resetCharTicks Also drop pending show-latest-character ticks
     */
    void stop(bool resetCharTicks = true);

    /**
     * stop(false) then start(): keeps the latest obscured character visible.
     */
    void restart(double nowMs);

    /**
     * Fire due ticks and advance the fade.
     * @return True if opacity or the pending char ticks changed
     */
    bool advance(double nowMs);

    /**
     * Time of the next scheduled tick, for hosts that sleep between frames.
     */
    std::optional<double> nextTickMs() const { return nextTickMs_; }

    bool isRunning() const { return running_; }
    bool targetVisible() const { return targetVisible_; }
    float opacity() const { return opacity_.value(); }
    bool currentlyVisible() const { return opacity_.value() > 0.0f; }

    int obscureShowCharTicksPending() const { return obscureShowCharTicksPending_; }
    void setObscureShowCharTicksPending(int ticks) { obscureShowCharTicksPending_ = ticks; }

private:
    void tick(double nowMs);

    CaretBlinkConfig config_;
    AnimationController opacity_;
    bool running_ = false;
    bool targetVisible_ = false;
    bool waitingForStart_ = false;
    std::optional<double> nextTickMs_;
    int obscureShowCharTicksPending_ = 0;
};

} // namespace richedit::animation

#endif // RICHEDIT_ANIMATION_CARET_BLINK_H
