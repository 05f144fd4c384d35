#ifndef RICHEDIT_EDITING_VALUE_H
#define RICHEDIT_EDITING_VALUE_H

#include "richedit/core/types.h"
#include "richedit/text/text_types.h"
#include <string>
#include <string_view>

namespace richedit::editing {

using text::TextAffinity;
using text::TextPosition;
using text::TextRange;

/**
 * TextSelection: base/extent pair in UTF-16 code units.
 *
 * The base stays put while the extent moves. (-1, -1) means "no selection".
 */
struct TextSelection {
    int baseOffset = -1;
    int extentOffset = -1;
    TextAffinity affinity = TextAffinity::Downstream;
    bool isDirectional = false;

    static TextSelection collapsed(int offset, TextAffinity affinity = TextAffinity::Downstream) {
        return TextSelection{offset, offset, affinity, false};
    }
    static TextSelection fromPosition(TextPosition position) {
        return collapsed(position.offset, position.affinity);
    }
    static TextSelection invalid() { return TextSelection{}; }

    int start() const { return baseOffset < extentOffset ? baseOffset : extentOffset; }
    int end() const { return baseOffset < extentOffset ? extentOffset : baseOffset; }
    bool isValid() const { return baseOffset >= 0 && extentOffset >= 0; }
    bool isCollapsed() const { return baseOffset == extentOffset; }

    TextPosition base() const {
        // Base of a collapsed selection shares the affinity; otherwise it faces the extent
        TextAffinity a = affinity;
        if (!isCollapsed()) {
            a = baseOffset < extentOffset ? TextAffinity::Downstream : TextAffinity::Upstream;
        }
        return TextPosition{baseOffset, a};
    }
    TextPosition extent() const { return TextPosition{extentOffset, affinity}; }
    TextRange range() const { return TextRange{start(), end()}; }

    TextSelection withExtent(int offset) const {
        return TextSelection{baseOffset, offset, affinity, isDirectional};
    }

    /**
     * Grow the selection so it also covers `position`. The base flips to
     * the far edge when the position is before the start.
     */
    TextSelection expandTo(TextPosition position, bool extentAtIndex = false) const;

    /**
     * Move the extent to `position`, keeping the base.
     */
    TextSelection extendTo(TextPosition position) const;
};

bool operator==(const TextSelection& a, const TextSelection& b);
inline bool operator!=(const TextSelection& a, const TextSelection& b) { return !(a == b); }

/**
 * EditingValue: immutable snapshot of (text, selection, composing).
 */
struct EditingValue {
    std::u16string text;
    TextSelection selection = TextSelection::invalid();
    TextRange composing = TextRange::empty();

    bool isComposingRangeValid() const {
        return composing.isValid() && composing.isNormalized() &&
               composing.end <= static_cast<int>(text.size());
    }

    /**
     * Replace `range` with `replacement`; the caret collapses after the
     * inserted text and composing is cleared. `range` must be valid.
     */
    EditingValue replaced(TextRange range, std::u16string_view replacement) const;
};

bool operator==(const EditingValue& a, const EditingValue& b);
inline bool operator!=(const EditingValue& a, const EditingValue& b) { return !(a == b); }

/**
 * Check that selection and composing offsets lie in [0, text.size()] (or
 * are the (-1, -1) sentinel).
 * @return EditError::Ok or EditError::ValidationError
 */
EditError validateValue(const EditingValue& value);

} // namespace richedit::editing

#endif // RICHEDIT_EDITING_VALUE_H
