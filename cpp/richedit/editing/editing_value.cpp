#include "richedit/editing/editing_value.h"

#include <algorithm>

namespace richedit::editing {

namespace {

bool offsetInText(int offset, std::size_t length) {
    return offset >= 0 && offset <= static_cast<int>(length);
}

} // namespace

TextSelection TextSelection::expandTo(TextPosition position, bool extentAtIndex) const {
    if (position.offset >= start() && position.offset <= end()) {
        return *this;
    }
    const bool normalized = baseOffset <= extentOffset;
    if (position.offset <= start()) {
        if (extentAtIndex) {
            return TextSelection{end(), position.offset, position.affinity, isDirectional};
        }
        return TextSelection{normalized ? end() : start(), position.offset, affinity, isDirectional};
    }
    if (extentAtIndex) {
        return TextSelection{start(), position.offset, position.affinity, isDirectional};
    }
    return TextSelection{normalized ? start() : end(), position.offset, affinity, isDirectional};
}

TextSelection TextSelection::extendTo(TextPosition position) const {
    if (extentOffset == position.offset && affinity == position.affinity) {
        return *this;
    }
    return TextSelection{baseOffset, position.offset, position.affinity, isDirectional};
}

bool operator==(const TextSelection& a, const TextSelection& b) {
    return a.baseOffset == b.baseOffset && a.extentOffset == b.extentOffset &&
           a.affinity == b.affinity && a.isDirectional == b.isDirectional;
}

EditingValue EditingValue::replaced(TextRange range, std::u16string_view replacement) const {
    const int length = static_cast<int>(text.size());
    const int s = std::clamp(std::min(range.start, range.end), 0, length);
    const int e = std::clamp(std::max(range.start, range.end), 0, length);

    EditingValue result;
    result.text.reserve(text.size() - static_cast<std::size_t>(e - s) + replacement.size());
    result.text.append(text, 0, static_cast<std::size_t>(s));
    result.text.append(replacement);
    result.text.append(text, static_cast<std::size_t>(e), std::u16string::npos);
    result.selection = TextSelection::collapsed(s + static_cast<int>(replacement.size()));
    result.composing = TextRange::empty();
    return result;
}

bool operator==(const EditingValue& a, const EditingValue& b) {
    return a.text == b.text && a.selection == b.selection && a.composing == b.composing;
}

EditError validateValue(const EditingValue& value) {
    const std::size_t length = value.text.size();

    const TextSelection& sel = value.selection;
    const bool noSelection = sel.baseOffset == -1 && sel.extentOffset == -1;
    if (!noSelection && !(offsetInText(sel.baseOffset, length) && offsetInText(sel.extentOffset, length))) {
        return EditError::ValidationError;
    }

    const TextRange& comp = value.composing;
    const bool noComposing = comp.start == -1 && comp.end == -1;
    if (!noComposing && !(offsetInText(comp.start, length) && offsetInText(comp.end, length) && comp.isNormalized())) {
        return EditError::ValidationError;
    }
    return EditError::Ok;
}

} // namespace richedit::editing
