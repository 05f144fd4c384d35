#ifndef RICHEDIT_EDITING_DIRECTIONALITY_NORMALIZER_H
#define RICHEDIT_EDITING_DIRECTIONALITY_NORMALIZER_H

#include "richedit/editing/text_input_formatter.h"

namespace richedit::editing {

constexpr char16_t kRightToLeftMark = 0x200F;
constexpr char16_t kLeftToRightMark = 0x200E;

/**
 * DirectionalityNormalizer: surrounds whitespace runs in mixed-direction text
 * with an invisible direction mark so the caret does not jump sides.
 *
 * Each whitespace run gets a mark after it, matching the direction of the
 * last non-whitespace character before the run. The mark is dropped again
 * when the run is followed by a character of that same direction, and an
 * existing mark right after the run takes its place. Selection and composing
 * offsets are shifted for every mark added or removed.
 *
 * Stays a no-op until text of the direction opposing the base direction has
 * been seen once; from then on it always runs.
 */
class DirectionalityNormalizer : public TextInputFormatter {
public:
    explicit DirectionalityNormalizer(TextDirection baseDirection);

    EditingValue formatEditUpdate(const EditingValue& oldValue, const EditingValue& newValue) override;

    TextDirection baseDirection() const { return baseDirection_; }
    bool hasOpposingDirection() const { return hasOpposingDirection_; }

    // Character classes used by the pass (approximate script ranges)
    static bool isLtrCodePoint(char32_t cp);
    static bool isRtlCodePoint(char32_t cp);
    static bool isDirectionalityMarker(char32_t cp) {
        return cp == kRightToLeftMark || cp == kLeftToRightMark;
    }

private:
    TextDirection directionOf(char32_t cp) const;
    bool containsOpposingDirection(std::u16string_view text) const;

    TextDirection baseDirection_;
    TextDirection previousNonWhitespaceDirection_;
    bool hasOpposingDirection_ = false;
};

} // namespace richedit::editing

#endif // RICHEDIT_EDITING_DIRECTIONALITY_NORMALIZER_H
