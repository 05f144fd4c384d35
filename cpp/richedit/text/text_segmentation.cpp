#include "richedit/text/text_segmentation.h"

#include "richedit/core/string_utils.h"
#include "richedit/text/inline_object_codec.h"

#include <hb.h>

#include <algorithm>

namespace richedit::text {

namespace {

hb_unicode_general_category_t generalCategory(char32_t cp) {
    return hb_unicode_general_category(hb_unicode_funcs_get_default(), static_cast<hb_codepoint_t>(cp));
}

bool isLetterCategory(hb_unicode_general_category_t gc) {
    switch (gc) {
        case HB_UNICODE_GENERAL_CATEGORY_LOWERCASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_UPPERCASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_TITLECASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_MODIFIER_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_OTHER_LETTER:
            return true;
        default:
            return false;
    }
}

bool isNumberCategory(hb_unicode_general_category_t gc) {
    return gc == HB_UNICODE_GENERAL_CATEGORY_DECIMAL_NUMBER ||
           gc == HB_UNICODE_GENERAL_CATEGORY_LETTER_NUMBER ||
           gc == HB_UNICODE_GENERAL_CATEGORY_OTHER_NUMBER;
}

bool isMarkCategory(hb_unicode_general_category_t gc) {
    return gc == HB_UNICODE_GENERAL_CATEGORY_NON_SPACING_MARK ||
           gc == HB_UNICODE_GENERAL_CATEGORY_SPACING_MARK ||
           gc == HB_UNICODE_GENERAL_CATEGORY_ENCLOSING_MARK;
}

bool isIdeograph(char32_t cp) {
    return (cp >= 0x3040 && cp <= 0x30FF) ||     // Hiragana, Katakana
           (cp >= 0x3400 && cp <= 0x4DBF) ||     // CJK Extension A
           (cp >= 0x4E00 && cp <= 0x9FFF) ||     // CJK Unified
           (cp >= 0xF900 && cp <= 0xFAFF) ||     // CJK Compatibility
           (cp >= 0x20000 && cp <= 0x3FFFF);     // CJK Extensions B+
}

bool isRegionalIndicator(char32_t cp) {
    return cp >= 0x1F1E6 && cp <= 0x1F1FF;
}

bool isPictographic(char32_t cp) {
    return (cp >= 0x1F000 && cp <= 0x1FAFF) ||
           (cp >= 0x2600 && cp <= 0x27BF) ||
           (cp >= 0x2300 && cp <= 0x23FF) ||
           (cp >= 0x2B00 && cp <= 0x2BFF) ||
           cp == 0x00A9 || cp == 0x00AE || cp == 0x203C || cp == 0x2049 ||
           cp == 0x2122 || cp == 0x2139 || (cp >= 0x2194 && cp <= 0x21AA) ||
           cp == 0x3030 || cp == 0x303D || cp == 0x3297 || cp == 0x3299;
}

// Grapheme_Cluster_Break=Extend (plus SpacingMark, ZWJ, ZWNJ)
bool isExtend(char32_t cp) {
    if (cp == 0x200C || cp == 0x200D) return true;
    if (cp >= 0x1F3FB && cp <= 0x1F3FF) return true;   // Emoji modifiers
    if (cp >= 0xE0020 && cp <= 0xE007F) return true;   // Tags
    return isMarkCategory(generalCategory(cp));
}

bool isControl(char32_t cp) {
    if (cp == 0x200C || cp == 0x200D || (cp >= 0xE0020 && cp <= 0xE007F)) {
        return false;
    }
    switch (generalCategory(cp)) {
        case HB_UNICODE_GENERAL_CATEGORY_CONTROL:
        case HB_UNICODE_GENERAL_CATEGORY_FORMAT:
        case HB_UNICODE_GENERAL_CATEGORY_LINE_SEPARATOR:
        case HB_UNICODE_GENERAL_CATEGORY_PARAGRAPH_SEPARATOR:
            return true;
        default:
            return false;
    }
}

enum class Hangul { None, L, V, T, LV, LVT };

Hangul hangulType(char32_t cp) {
    if ((cp >= 0x1100 && cp <= 0x115F) || (cp >= 0xA960 && cp <= 0xA97C)) return Hangul::L;
    if ((cp >= 0x1160 && cp <= 0x11A7) || (cp >= 0xD7B0 && cp <= 0xD7C6)) return Hangul::V;
    if ((cp >= 0x11A8 && cp <= 0x11FF) || (cp >= 0xD7CB && cp <= 0xD7FB)) return Hangul::T;
    if (cp >= 0xAC00 && cp <= 0xD7A3) {
        return ((cp - 0xAC00) % 28 == 0) ? Hangul::LV : Hangul::LVT;
    }
    return Hangul::None;
}

bool hangulJoins(Hangul a, Hangul b) {
    if (a == Hangul::L) return b == Hangul::L || b == Hangul::V || b == Hangul::LV || b == Hangul::LVT;
    if (a == Hangul::LV || a == Hangul::V) return b == Hangul::V || b == Hangul::T;
    if (a == Hangul::LVT || a == Hangul::T) return b == Hangul::T;
    return false;
}

bool isMidLetter(char32_t cp) {
    switch (cp) {
        case u'\'': case u'.': case u':':
        case 0x00B7: case 0x2018: case 0x2019: case 0x2024: case 0x2027:
            return true;
        default:
            return false;
    }
}

CharClass classAt(std::u16string_view text, std::uint32_t offset) {
    std::uint32_t unitLen = 0;
    return classifyCodePoint(decodeUtf16At(text, offset, unitLen));
}

} // namespace

CharClass classifyCodePoint(char32_t cp) {
    if (isReserved(cp)) return CharClass::InlineObject;
    if (cp == u'\n' || cp == u'\r' || cp == 0x2028 || cp == 0x2029) return CharClass::Newline;
    if (isWhitespaceCodePoint(cp)) return CharClass::Whitespace;
    if (cp == u'-' || cp == 0x2010 || cp == 0x00AD) return CharClass::Hyphen;
    if (isMidLetter(cp)) return CharClass::MidLetter;
    if (isIdeograph(cp)) return CharClass::Ideograph;

    const hb_unicode_general_category_t gc = generalCategory(cp);
    if (isLetterCategory(gc) || isNumberCategory(gc) || isMarkCategory(gc) ||
        gc == HB_UNICODE_GENERAL_CATEGORY_CONNECT_PUNCTUATION) {
        return CharClass::Word;
    }
    return CharClass::Other;
}

BidiClass bidiClassOf(char32_t cp) {
    // Directional marks (LRM, RLM, ALM) are format characters but strong
    if (cp == 0x200E) return BidiClass::StrongLTR;
    if (cp == 0x200F || cp == 0x061C) return BidiClass::StrongRTL;
    // Arabic-Indic digits order like ASCII digits
    if ((cp >= 0x0660 && cp <= 0x0669) || (cp >= 0x06F0 && cp <= 0x06F9)) return BidiClass::StrongLTR;
    if ((cp >= 0x0591 && cp <= 0x07FF) ||
        (cp >= 0xFB1D && cp <= 0xFDFD) ||
        (cp >= 0xFE70 && cp <= 0xFEFC) ||
        (cp >= 0x10800 && cp <= 0x10FFF) ||
        (cp >= 0x1E800 && cp <= 0x1EFFF)) {
        return BidiClass::StrongRTL;
    }
    const hb_unicode_general_category_t gc = generalCategory(cp);
    if (isLetterCategory(gc) || gc == HB_UNICODE_GENERAL_CATEGORY_DECIMAL_NUMBER) {
        return BidiClass::StrongLTR;
    }
    return BidiClass::Neutral;
}

// =============================================================================
// Grapheme Clusters
// =============================================================================

bool isGraphemeBoundary(std::u16string_view text, std::uint32_t offset) {
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    if (offset == 0 || offset >= length) {
        return true;
    }
    // Never split a surrogate pair
    if (isLowSurrogate(text[offset]) && isHighSurrogate(text[offset - 1])) {
        return false;
    }

    std::uint32_t lenA = 0;
    std::uint32_t lenB = 0;
    const char32_t a = decodeUtf16Before(text, offset, lenA);
    const char32_t b = decodeUtf16At(text, offset, lenB);

    if (a == u'\r' && b == u'\n') return false;
    if (isReserved(a) || isReserved(b)) return true;
    if (isControl(a) || isControl(b) || a == u'\n' || a == u'\r' || b == u'\n' || b == u'\r') return true;
    if (hangulJoins(hangulType(a), hangulType(b))) return false;
    if (isExtend(b)) return false;
    if (a == 0x200D && isPictographic(b)) return false;

    if (isRegionalIndicator(a) && isRegionalIndicator(b)) {
        // Pair regional indicators from the start of the run
        std::uint32_t count = 0;
        std::uint32_t pos = offset;
        while (pos > 0) {
            std::uint32_t len = 0;
            const char32_t cp = decodeUtf16Before(text, pos, len);
            if (!isRegionalIndicator(cp)) break;
            ++count;
            pos -= len;
        }
        return (count % 2) == 0;
    }
    return true;
}

std::uint32_t nextGraphemeBoundary(std::u16string_view text, std::uint32_t offset) {
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    if (offset >= length) {
        return length;
    }
    std::uint32_t unitLen = 0;
    decodeUtf16At(text, offset, unitLen);
    std::uint32_t pos = offset + unitLen;
    while (pos < length && !isGraphemeBoundary(text, pos)) {
        decodeUtf16At(text, pos, unitLen);
        pos += std::max<std::uint32_t>(unitLen, 1);
    }
    return pos;
}

std::uint32_t previousGraphemeBoundary(std::u16string_view text, std::uint32_t offset) {
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    if (offset == 0) {
        return 0;
    }
    std::uint32_t pos = std::min(offset, length);
    std::uint32_t unitLen = 0;
    decodeUtf16Before(text, pos, unitLen);
    pos -= std::max<std::uint32_t>(unitLen, 1);
    while (pos > 0 && !isGraphemeBoundary(text, pos)) {
        decodeUtf16Before(text, pos, unitLen);
        pos -= std::max<std::uint32_t>(unitLen, 1);
    }
    return pos;
}

std::vector<std::uint32_t> graphemeBoundaries(std::u16string_view text) {
    std::vector<std::uint32_t> starts;
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    std::uint32_t pos = 0;
    while (pos < length) {
        starts.push_back(pos);
        pos = nextGraphemeBoundary(text, pos);
    }
    starts.push_back(length);
    return starts;
}

// =============================================================================
// Words
// =============================================================================

TextRange wordBoundaryAt(std::u16string_view text, std::uint32_t offset) {
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    if (offset >= length) {
        return TextRange::collapsed(static_cast<int>(length));
    }

    const std::vector<std::uint32_t> starts = graphemeBoundaries(text);
    const std::size_t count = starts.size() - 1;

    // Grapheme containing offset
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    std::size_t index = static_cast<std::size_t>(std::distance(starts.begin(), it)) - 1;

    std::vector<CharClass> classes(count);
    for (std::size_t i = 0; i < count; ++i) {
        classes[i] = classAt(text, starts[i]);
    }

    auto isWordAt = [&](std::size_t i) { return i < count && classes[i] == CharClass::Word; };

    CharClass cls = classes[index];
    if (cls == CharClass::MidLetter && index > 0 && isWordAt(index - 1) && isWordAt(index + 1)) {
        cls = CharClass::Word;
    }

    std::size_t first = index;
    std::size_t last = index;
    if (cls == CharClass::Word) {
        while (first > 0) {
            if (isWordAt(first - 1)) {
                --first;
            } else if (first >= 2 && classes[first - 1] == CharClass::MidLetter && isWordAt(first - 2)) {
                first -= 2;
            } else {
                break;
            }
        }
        while (last + 1 < count) {
            if (isWordAt(last + 1)) {
                ++last;
            } else if (classes[last + 1] == CharClass::MidLetter && isWordAt(last + 2)) {
                last += 2;
            } else {
                break;
            }
        }
    } else if (cls == CharClass::Whitespace) {
        while (first > 0 && classes[first - 1] == CharClass::Whitespace) --first;
        while (last + 1 < count && classes[last + 1] == CharClass::Whitespace) ++last;
    }

    return TextRange{static_cast<int>(starts[first]), static_cast<int>(starts[last + 1])};
}

bool isWhitespaceOnly(std::u16string_view text, TextRange range) {
    if (!range.isValid() || range.isCollapsed()) {
        return false;
    }
    std::uint32_t pos = static_cast<std::uint32_t>(std::min(range.start, range.end));
    const std::uint32_t end = std::min<std::uint32_t>(static_cast<std::uint32_t>(std::max(range.start, range.end)),
                                                      static_cast<std::uint32_t>(text.size()));
    while (pos < end) {
        std::uint32_t unitLen = 0;
        const char32_t cp = decodeUtf16At(text, pos, unitLen);
        if (!isWhitespaceCodePoint(cp)) {
            return false;
        }
        pos += unitLen;
    }
    return true;
}

} // namespace richedit::text
