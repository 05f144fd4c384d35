#ifndef RICHEDIT_ANIMATION_CURVES_H
#define RICHEDIT_ANIMATION_CURVES_H

#include <cstdint>

namespace richedit::animation {

/**
 * Cubic Bezier easing through (0, 0), (a, b), (c, d), (1, 1).
 */
class Cubic {
public:
    constexpr Cubic(float a, float b, float c, float d) : a_(a), b_(b), c_(c), d_(d) {}

    /**
     * Curve value at `t` in [0, 1]; exact at 0 and 1.
     */
    float transform(float t) const;

private:
    float a_;
    float b_;
    float c_;
    float d_;
};

enum class Curve : std::uint8_t {
    Linear = 0,
    Decelerate = 1,     // 1 - (1 - t)^2
    EaseOut = 2,        // Cubic(0, 0, 0.58, 1)
    FastOutSlowIn = 3,  // Cubic(0.4, 0, 0.2, 1)
};

float applyCurve(Curve curve, float t);

} // namespace richedit::animation

#endif // RICHEDIT_ANIMATION_CURVES_H
