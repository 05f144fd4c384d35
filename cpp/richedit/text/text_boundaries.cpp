#include "richedit/text/text_layout.h"

#include "richedit/core/string_utils.h"
#include "richedit/text/text_segmentation.h"

#include <algorithm>

namespace richedit::text {

TextRange TextLayoutEngine::getWordBoundary(TextPosition position) const {
    const int offset = std::max(position.offset, 0);
    return wordBoundaryAt(text_, static_cast<std::uint32_t>(offset));
}

TextRange TextLayoutEngine::getLineBoundary(TextPosition position) const {
    if (layout_.lines.empty()) {
        return TextRange::collapsed(0);
    }
    const LayoutLine& line = layout_.lines[lineIndexForOffset(position.offset, position.affinity)];
    return TextRange{static_cast<int>(line.startOffset), static_cast<int>(line.endOffset)};
}

std::optional<int> TextLayoutEngine::getOffsetAfter(int offset) const {
    if (offset < 0 || offset >= static_cast<int>(text_.size())) {
        return std::nullopt;
    }
    std::uint32_t unitLen = 0;
    decodeUtf16At(text_, static_cast<std::size_t>(offset), unitLen);
    return offset + static_cast<int>(unitLen);
}

std::optional<int> TextLayoutEngine::getOffsetBefore(int offset) const {
    if (offset <= 0 || offset > static_cast<int>(text_.size())) {
        return std::nullopt;
    }
    std::uint32_t unitLen = 0;
    decodeUtf16Before(text_, static_cast<std::size_t>(offset), unitLen);
    return offset - static_cast<int>(unitLen);
}

} // namespace richedit::text
