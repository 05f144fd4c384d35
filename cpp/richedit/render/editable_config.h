#ifndef RICHEDIT_RENDER_EDITABLE_CONFIG_H
#define RICHEDIT_RENDER_EDITABLE_CONFIG_H

#include "richedit/core/types.h"
#include "richedit/text/text_types.h"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

namespace richedit::render {

// Caret geometry family. Tall: caret a little taller than the line, centered
// on the glyph. Inset: caret inset from the line top, stretched to the glyph.
enum class CaretStyle : std::uint8_t {
    Tall = 0,
    Inset = 1,
};

// Which modifier keys select word and line movement.
// MacOS: alt = word, meta = line, meta = shortcuts.
// Standard: ctrl = word, alt = line, ctrl = shortcuts.
enum class KeyboardFlavor : std::uint8_t {
    MacOS = 0,
    Standard = 1,
};

// Whether a word selection landing on whitespace extends back to the previous word.
enum class PreviousWordPolicy : std::uint8_t {
    Always = 0,
    WhenReadOnly = 1,
    Never = 2,
};

struct BoxConstraints {
    float minWidth = 0.0f;
    float maxWidth = std::numeric_limits<float>::infinity();
    float minHeight = 0.0f;
    float maxHeight = std::numeric_limits<float>::infinity();

    static BoxConstraints loose(float width, float height = std::numeric_limits<float>::infinity()) {
        return BoxConstraints{0.0f, width, 0.0f, height};
    }
    static BoxConstraints tight(Size size) {
        return BoxConstraints{size.width, size.width, size.height, size.height};
    }

    float constrainWidth(float width) const { return std::min(std::max(width, minWidth), maxWidth); }
    float constrainHeight(float height) const { return std::min(std::max(height, minHeight), maxHeight); }
};

inline bool operator==(const BoxConstraints& a, const BoxConstraints& b) {
    return a.minWidth == b.minWidth && a.maxWidth == b.maxWidth &&
           a.minHeight == b.minHeight && a.maxHeight == b.maxHeight;
}
inline bool operator!=(const BoxConstraints& a, const BoxConstraints& b) { return !(a == b); }

/**
 * EditableConfig: presentation and behavior parameters of one editable.
 *
 * Line counts: maxLines == 1 is a single-line field that scrolls
 * horizontally. Unset maxLines grows without bound. `expands` requires both
 * line counts to be unset.
 */
struct EditableConfig {
    // Lines
    std::optional<int> maxLines = 1;
    std::optional<int> minLines;
    bool expands = false;
    bool forceLine = true;

    // Text
    float textScaleFactor = 1.0f;
    TextAlign textAlign = TextAlign::Start;
    TextDirection textDirection = TextDirection::LTR;
    bool obscureText = false;
    char16_t obscuringCharacter = u'\u2022';

    // Caret
    CaretStyle caretStyle = CaretStyle::Inset;
    float cursorWidth = 1.0f;
    std::optional<float> cursorHeight;      // Defaults to the preferred line height
    std::optional<float> cursorRadius;
    Point2 cursorOffset{};
    bool showCursor = true;
    bool paintCursorAboveText = false;
    Color cursorColor{0.0f, 0.0f, 0.0f, 1.0f};
    std::optional<Color> backgroundCursorColor;
    EdgeInsets floatingCursorAddedMargin{4.0f, 4.0f, 4.0f, 5.0f};

    // Selection
    bool readOnly = false;
    bool selectionEnabled = true;
    std::optional<Color> selectionColor;
    text::BoxHeightStyle selectionHeightStyle = text::BoxHeightStyle::Tight;
    text::BoxWidthStyle selectionWidthStyle = text::BoxWidthStyle::Tight;
    std::optional<Color> promptRectColor;

    // Platform behavior
    KeyboardFlavor keyboardFlavor = KeyboardFlavor::Standard;
    PreviousWordPolicy previousWordPolicy = PreviousWordPolicy::WhenReadOnly;
    float devicePixelRatio = 1.0f;

    bool isMultiline() const { return !maxLines || *maxLines != 1; }
};

/**
 * Check line counts and sizes.
 * @throws std::invalid_argument on non-positive line counts, minLines >
 *         maxLines, expands with line counts set, a negative cursor width, or
 *         a non-positive text scale factor, cursor height or device pixel ratio
 */
void validateEditableConfig(const EditableConfig& config);

} // namespace richedit::render

#endif // RICHEDIT_RENDER_EDITABLE_CONFIG_H
