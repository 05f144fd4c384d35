#ifndef RICHEDIT_TEXT_SEGMENTATION_H
#define RICHEDIT_TEXT_SEGMENTATION_H

#include "richedit/text/text_types.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace richedit::text {

// Coarse classes driving word segmentation and line breaking.
enum class CharClass : std::uint8_t {
    Whitespace = 0,
    Newline = 1,
    Word = 2,          // Letters, digits, marks, connector punctuation
    MidLetter = 3,     // Apostrophe, period, colon: joins two Word runs
    Ideograph = 4,     // Han, kana: one word per character
    InlineObject = 5,  // Reserved code point
    Hyphen = 6,
    Other = 7,         // Punctuation and symbols: one word per character
};

enum class BidiClass : std::uint8_t {
    Neutral = 0,
    StrongLTR = 1,
    StrongRTL = 2,
};

CharClass classifyCodePoint(char32_t cp);
BidiClass bidiClassOf(char32_t cp);

// =============================================================================
// Grapheme Clusters (extended, simplified UAX #29)
// =============================================================================

/**
 * Offset of the grapheme boundary after `offset`.
 * @return text.size() when `offset` is at or past the end
 */
std::uint32_t nextGraphemeBoundary(std::u16string_view text, std::uint32_t offset);

/**
 * Offset of the grapheme boundary before `offset`.
 * @return 0 when `offset` is 0
 */
std::uint32_t previousGraphemeBoundary(std::u16string_view text, std::uint32_t offset);

bool isGraphemeBoundary(std::u16string_view text, std::uint32_t offset);

/**
 * Start offsets of every grapheme, followed by text.size().
 */
std::vector<std::uint32_t> graphemeBoundaries(std::u16string_view text);

// =============================================================================
// Words
// =============================================================================

/**
 * Range of the word containing `offset`.
 *
 * Whitespace runs form one range, each ideograph, inline object, newline or
 * punctuation character is its own range. Offsets at or past the end yield
 * the collapsed range (length, length).
 */
TextRange wordBoundaryAt(std::u16string_view text, std::uint32_t offset);

/**
 * True if every code point in [range.start, range.end) is whitespace.
 */
bool isWhitespaceOnly(std::u16string_view text, TextRange range);

} // namespace richedit::text

#endif // RICHEDIT_TEXT_SEGMENTATION_H
