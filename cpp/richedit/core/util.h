#ifndef RICHEDIT_CORE_UTIL_H
#define RICHEDIT_CORE_UTIL_H

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace richedit {

// Monotonic milliseconds. Hosts normally pass their own frame time; this is the
// fallback clock for callers that do not.
inline double monotonicNowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}

inline float lerpF(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

inline float clampF(float v, float lo, float hi) noexcept {
    return std::min(std::max(v, lo), hi);
}

inline int clampI(int v, int lo, int hi) noexcept {
    return std::min(std::max(v, lo), hi);
}

} // namespace richedit

#endif // RICHEDIT_CORE_UTIL_H
