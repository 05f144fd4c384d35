#ifndef RICHEDIT_CORE_TYPES_H
#define RICHEDIT_CORE_TYPES_H

#include <algorithm>
#include <cstdint>

// Lightweight geometry and enum types shared by every richedit module.
// Coordinates are y-down, in logical pixels.

namespace richedit {

struct Point2 {
    float x = 0.0f;
    float y = 0.0f;
};

inline Point2 operator+(Point2 a, Point2 b) { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 operator-(Point2 a, Point2 b) { return Point2{a.x - b.x, a.y - b.y}; }
inline bool operator==(Point2 a, Point2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Point2 a, Point2 b) { return !(a == b); }

struct Size {
    float width = 0.0f;
    float height = 0.0f;
};

inline bool operator==(Size a, Size b) { return a.width == b.width && a.height == b.height; }
inline bool operator!=(Size a, Size b) { return !(a == b); }

struct Rect {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    static Rect fromLTWH(float l, float t, float w, float h) { return Rect{l, t, l + w, t + h}; }

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    Point2 topLeft() const { return Point2{left, top}; }
    Point2 center() const { return Point2{(left + right) * 0.5f, (top + bottom) * 0.5f}; }
    Point2 centerLeft() const { return Point2{left, (top + bottom) * 0.5f}; }

    Rect shift(Point2 d) const { return Rect{left + d.x, top + d.y, right + d.x, bottom + d.y}; }
    Rect inflate(float delta) const { return Rect{left - delta, top - delta, right + delta, bottom + delta}; }

    bool contains(Point2 p) const {
        return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
    }

    Rect expandToInclude(const Rect& o) const {
        return Rect{std::min(left, o.left), std::min(top, o.top), std::max(right, o.right), std::max(bottom, o.bottom)};
    }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

struct EdgeInsets {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    Rect inflateRect(const Rect& r) const {
        return Rect{r.left - left, r.top - top, r.right + right, r.bottom + bottom};
    }
};

// RGBA, 0-1
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    Color withOpacity(float opacity) const { return Color{r, g, b, opacity}; }
};

inline bool operator==(const Color& x, const Color& y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

enum class TextDirection : std::uint8_t {
    LTR = 0,
    RTL = 1,
};

enum class TextAlign : std::uint8_t {
    Left = 0,
    Right = 1,
    Center = 2,
    Start = 3,
    End = 4,
};

enum class Axis : std::uint8_t {
    Horizontal = 0,
    Vertical = 1,
};

// Result codes for fallible editing operations.
enum class EditError : std::uint32_t {
    Ok = 0,
    ValidationError = 1,  // Offsets outside [0, text.length]; previous value retained
    InvalidArgument = 2,  // Caller misuse
    Unavailable = 3,      // Query needs a full layout pass
};

inline const char* editErrorName(EditError e) {
    switch (e) {
        case EditError::Ok: return "Ok";
        case EditError::ValidationError: return "ValidationError";
        case EditError::InvalidArgument: return "InvalidArgument";
        case EditError::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

} // namespace richedit

#endif // RICHEDIT_CORE_TYPES_H
