#include "richedit/text/span_builder.h"

#include "richedit/core/string_utils.h"

#include <algorithm>

namespace richedit::text {

namespace {

TextStyle underlined(const TextStyle& style) {
    TextStyle s = style;
    s.flags = s.flags | TextStyleFlags::Underline;
    return s;
}

bool insideComposing(std::uint32_t start, std::uint32_t end, const TextRange& composing) {
    return static_cast<int>(start) >= composing.start && static_cast<int>(end) <= composing.end;
}

// Emit [start, end) as text, split at the composing bounds.
void emitTextRun(
    std::uint32_t start,
    std::uint32_t end,
    const TextStyle& style,
    const TextRange& composing,
    bool composingActive,
    std::vector<Span>& out
) {
    if (start >= end) {
        return;
    }
    if (!composingActive) {
        out.emplace_back(TextRunSpan{start, end - start, style});
        return;
    }

    std::uint32_t cuts[4] = {
        start,
        std::clamp<std::uint32_t>(static_cast<std::uint32_t>(composing.start), start, end),
        std::clamp<std::uint32_t>(static_cast<std::uint32_t>(composing.end), start, end),
        end,
    };
    for (int i = 0; i < 3; ++i) {
        if (cuts[i] >= cuts[i + 1]) {
            continue;
        }
        const bool decorated = insideComposing(cuts[i], cuts[i + 1], composing);
        out.emplace_back(TextRunSpan{cuts[i], cuts[i + 1] - cuts[i], decorated ? underlined(style) : style});
    }
}

} // namespace

std::vector<Span> buildSpans(
    std::u16string_view text,
    const TextStyle& style,
    const InlineContentResolver& resolver,
    TextRange composing,
    const SpanBuildOptions& options
) {
    std::vector<Span> spans;
    const std::uint32_t length = static_cast<std::uint32_t>(text.size());
    const bool composingActive = composing.isValid() && !composing.isCollapsed() &&
        composing.isNormalized() && composing.end <= static_cast<int>(length);

    std::uint32_t runStart = 0;
    std::uint32_t pos = 0;
    while (pos < length) {
        std::uint32_t unitLen = 0;
        const char32_t cp = decodeUtf16At(text, pos, unitLen);
        if (!isReserved(cp)) {
            pos += unitLen;
            continue;
        }

        emitTextRun(runStart, pos, style, composing, composingActive, spans);

        const bool decorated = composingActive && insideComposing(pos, pos + unitLen, composing);
        const TextStyle objectStyle = decorated ? underlined(style) : style;
        InlineContent* content = decodeInlineObject(resolver, cp);
        if (content) {
            spans.emplace_back(InlineObjectSpan{pos, cp, content, options.alignment, options.baseline, objectStyle});
        } else {
            // Unmapped: stays a lone text span, never merged with neighbours.
            spans.emplace_back(TextRunSpan{pos, unitLen, objectStyle});
        }

        pos += unitLen;
        runStart = pos;
    }
    emitTextRun(runStart, length, style, composing, composingActive, spans);

    return spans;
}

std::uint32_t spanStart(const Span& span) {
    return std::visit([](const auto& s) { return s.start; }, span);
}

std::uint32_t spanLength(const Span& span) {
    if (const auto* run = std::get_if<TextRunSpan>(&span)) {
        return run->length;
    }
    return static_cast<std::uint32_t>(utf16Length(std::get<InlineObjectSpan>(span).codePoint));
}

const TextStyle& spanStyle(const Span& span) {
    return std::visit([](const auto& s) -> const TextStyle& { return s.style; }, span);
}

std::vector<const InlineObjectSpan*> inlineObjectSpans(const std::vector<Span>& spans) {
    std::vector<const InlineObjectSpan*> out;
    for (const Span& span : spans) {
        if (const auto* obj = std::get_if<InlineObjectSpan>(&span)) {
            out.push_back(obj);
        }
    }
    return out;
}

} // namespace richedit::text
