#include "richedit/animation/curves.h"

#include "richedit/core/util.h"

#include <cmath>

namespace richedit::animation {

namespace {

constexpr float kCubicErrorBound = 0.001f;
constexpr int kMaxBisectionSteps = 64;

constexpr Cubic kEaseOut{0.0f, 0.0f, 0.58f, 1.0f};
constexpr Cubic kFastOutSlowIn{0.4f, 0.0f, 0.2f, 1.0f};

float evaluateCubic(float a, float b, float m) {
    return 3.0f * a * (1.0f - m) * (1.0f - m) * m + 3.0f * b * (1.0f - m) * m * m + m * m * m;
}

} // namespace

float Cubic::transform(float t) const {
    if (t <= 0.0f) return 0.0f;
    if (t >= 1.0f) return 1.0f;
    // Bisect for the parameter whose x matches t, then evaluate y there
    float start = 0.0f;
    float end = 1.0f;
    float midpoint = 0.5f;
    for (int i = 0; i < kMaxBisectionSteps; ++i) {
        midpoint = (start + end) * 0.5f;
        const float estimate = evaluateCubic(a_, c_, midpoint);
        if (std::fabs(t - estimate) < kCubicErrorBound) {
            break;
        }
        if (estimate < t) {
            start = midpoint;
        } else {
            end = midpoint;
        }
    }
    return evaluateCubic(b_, d_, midpoint);
}

float applyCurve(Curve curve, float t) {
    t = clampF(t, 0.0f, 1.0f);
    switch (curve) {
        case Curve::Linear:
            return t;
        case Curve::Decelerate:
            return 1.0f - (1.0f - t) * (1.0f - t);
        case Curve::EaseOut:
            return kEaseOut.transform(t);
        case Curve::FastOutSlowIn:
            return kFastOutSlowIn.transform(t);
    }
    return t;
}

} // namespace richedit::animation
