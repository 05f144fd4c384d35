#include "richedit/editing/directionality_normalizer.h"

#include "richedit/core/string_utils.h"

#include <optional>

namespace richedit::editing {

DirectionalityNormalizer::DirectionalityNormalizer(TextDirection baseDirection)
    : baseDirection_(baseDirection)
    , previousNonWhitespaceDirection_(baseDirection) {
}

bool DirectionalityNormalizer::isLtrCodePoint(char32_t cp) {
    // Latin, ideographic, Cyrillic, Indic and SE Asian scripts, symbols
    return (cp >= u'A' && cp <= u'Z') || (cp >= u'a' && cp <= u'z') ||
           (cp >= 0x00C0 && cp <= 0x00D6) || (cp >= 0x00D8 && cp <= 0x00F6) ||
           (cp >= 0x00F8 && cp <= 0x02B8) || (cp >= 0x0300 && cp <= 0x0590) ||
           (cp >= 0x0800 && cp <= 0x1FFF) || (cp >= 0x2C00 && cp <= 0xFB1C) ||
           (cp >= 0xFDFE && cp <= 0xFE6F) || (cp >= 0xFEFD && cp <= 0xFFFF) ||
           cp >= 0x10000;
}

bool DirectionalityNormalizer::isRtlCodePoint(char32_t cp) {
    // Hebrew, Arabic, Syriac, Thaana and their presentation forms
    return (cp >= 0x0591 && cp <= 0x07FF) || (cp >= 0xFB1D && cp <= 0xFDFD) ||
           (cp >= 0xFE70 && cp <= 0xFEFC);
}

TextDirection DirectionalityNormalizer::directionOf(char32_t cp) const {
    return isLtrCodePoint(cp) ? TextDirection::LTR : TextDirection::RTL;
}

bool DirectionalityNormalizer::containsOpposingDirection(std::u16string_view text) const {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t unitLen = 0;
        const char32_t cp = decodeUtf16At(text, pos, unitLen);
        const bool opposing = baseDirection_ == TextDirection::LTR ? isRtlCodePoint(cp) : isLtrCodePoint(cp);
        if (opposing) return true;
        pos += unitLen;
    }
    return false;
}

EditingValue DirectionalityNormalizer::formatEditUpdate(const EditingValue& oldValue, const EditingValue& newValue) {
    (void)oldValue;
    if (!hasOpposingDirection_) {
        hasOpposingDirection_ = containsOpposingDirection(newValue.text);
    }
    if (!hasOpposingDirection_) {
        return newValue;
    }

    previousNonWhitespaceDirection_ = baseDirection_;

    std::u16string out;
    out.reserve(newValue.text.size() + 8);

    int selectionBase = newValue.selection.baseOffset;
    int selectionExtent = newValue.selection.extentOffset;
    int composingStart = newValue.composing.start;
    int composingEnd = newValue.composing.end;

    // A mark is about to be appended at out.size(): offsets at or after it shift right
    auto markerInserted = [&]() {
        const int at = static_cast<int>(out.size());
        for (int* offset : {&selectionBase, &selectionExtent, &composingStart, &composingEnd}) {
            if (*offset >= at) *offset += 1;
        }
    };
    // The trailing mark at out.size() - 1 is about to be removed
    auto markerRemoved = [&]() {
        const int at = static_cast<int>(out.size()) - 1;
        for (int* offset : {&selectionBase, &selectionExtent, &composingStart, &composingEnd}) {
            if (*offset > at) *offset -= 1;
        }
        out.pop_back();
    };

    bool previousWasWhitespace = false;
    bool previousWasMarker = false;
    std::optional<char32_t> previousNonWhitespace;

    std::size_t pos = 0;
    const std::u16string& text = newValue.text;
    while (pos < text.size()) {
        std::uint32_t unitLen = 0;
        const char32_t cp = decodeUtf16At(text, pos, unitLen);
        pos += unitLen;

        if (isWhitespaceCodePoint(cp)) {
            if (!previousWasWhitespace && previousNonWhitespace) {
                previousNonWhitespaceDirection_ = directionOf(*previousNonWhitespace);
            }
            // Move the mark of this run to after the new whitespace
            if (previousWasWhitespace) {
                markerRemoved();
            }
            appendUtf16(out, cp);
            markerInserted();
            out.push_back(previousNonWhitespaceDirection_ == TextDirection::RTL ? kRightToLeftMark : kLeftToRightMark);

            previousWasWhitespace = true;
            previousWasMarker = false;
        } else if (isDirectionalityMarker(cp)) {
            // An existing mark replaces the one added for the run
            if (previousWasWhitespace) {
                markerRemoved();
            }
            appendUtf16(out, cp);

            previousWasWhitespace = false;
            previousWasMarker = true;
        } else {
            // Run already enclosed by this direction: the added mark is redundant
            if (!previousWasMarker && previousWasWhitespace && directionOf(cp) == previousNonWhitespaceDirection_) {
                markerRemoved();
            }
            previousNonWhitespace = cp;
            appendUtf16(out, cp);

            previousWasWhitespace = false;
            previousWasMarker = false;
        }
    }

    EditingValue result;
    result.text = std::move(out);
    result.selection = TextSelection{
        selectionBase, selectionExtent, newValue.selection.affinity, newValue.selection.isDirectional
    };
    result.composing = TextRange{composingStart, composingEnd};
    return result;
}

} // namespace richedit::editing
