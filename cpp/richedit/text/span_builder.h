#ifndef RICHEDIT_TEXT_SPAN_BUILDER_H
#define RICHEDIT_TEXT_SPAN_BUILDER_H

#include "richedit/text/inline_object_codec.h"
#include "richedit/text/text_types.h"
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace richedit::text {

// A contiguous run of displayable text.
struct TextRunSpan {
    std::uint32_t start;    // UTF-16 offset into the flat string
    std::uint32_t length;   // UTF-16 length, never 0
    TextStyle style;
};

// Exactly one reserved code point rendered as external content.
struct InlineObjectSpan {
    std::uint32_t start;
    char32_t codePoint;
    InlineContent* content;   // Not owned
    PlaceholderAlignment alignment;
    TextBaseline baseline;
    TextStyle style;
};

using Span = std::variant<TextRunSpan, InlineObjectSpan>;

struct SpanBuildOptions {
    PlaceholderAlignment alignment = PlaceholderAlignment::Bottom;
    TextBaseline baseline = TextBaseline::Alphabetic;
};

/**
 * Partition the flat string into text and inline-object spans.
 *
 * Spans are ordered and offset-contiguous; their lengths sum to text.size().
 * Every reserved code point the resolver maps becomes its own inline-object
 * span. One it does not map becomes its own one-unit text span. Spans inside
 * a valid, non-collapsed `composing` range carry the Underline flag; text
 * runs are split at the composing bounds for that purpose.
 */
std::vector<Span> buildSpans(
    std::u16string_view text,
    const TextStyle& style,
    const InlineContentResolver& resolver,
    TextRange composing = TextRange::empty(),
    const SpanBuildOptions& options = SpanBuildOptions{}
);

std::uint32_t spanStart(const Span& span);
std::uint32_t spanLength(const Span& span);
const TextStyle& spanStyle(const Span& span);

inline bool isInlineObject(const Span& span) {
    return std::holds_alternative<InlineObjectSpan>(span);
}

/**
 * Inline-object spans in order (index i corresponds to placeholder i).
 */
std::vector<const InlineObjectSpan*> inlineObjectSpans(const std::vector<Span>& spans);

} // namespace richedit::text

#endif // RICHEDIT_TEXT_SPAN_BUILDER_H
