#include "richedit/interaction/selection_controller.h"

#include "richedit/core/string_utils.h"
#include "richedit/text/text_segmentation.h"

#include <algorithm>

namespace richedit::interaction {

using render::PreviousWordPolicy;
using text::TextAffinity;

SelectionController::SelectionController(
    render::EditableLayout& layout,
    TextSelectionDelegate* delegate,
    Clipboard* clipboard
)
    : layout_(layout), delegate_(delegate), clipboard_(clipboard) {}

// =============================================================================
// Selection Change
// =============================================================================

bool SelectionController::handleSelectionChange(const TextSelection& next, SelectionChangedCause cause) {
    // An unfocused editable receiving (0, 0) still reports it so the IME
    // learns about the focus-triggered selection
    const bool focusingEmpty = next.baseOffset == 0 && next.extentOffset == 0 && !layout_.hasFocus();
    if (next == layout_.selection() && cause != SelectionChangedCause::Keyboard && !focusingEmpty) {
        return false;
    }
    if (onSelectionChanged_) {
        onSelectionChanged_(next, cause);
    }
    return true;
}

// =============================================================================
// Gestures
// =============================================================================

void SelectionController::selectPosition(SelectionChangedCause cause) {
    if (!lastTapDownPosition_) return;
    selectPositionAt(*lastTapDownPosition_, std::nullopt, cause);
}

void SelectionController::selectWord(SelectionChangedCause cause) {
    if (!lastTapDownPosition_) return;
    selectWordsInRange(*lastTapDownPosition_, std::nullopt, cause);
}

void SelectionController::selectWordEdge(SelectionChangedCause cause) {
    if (!lastTapDownPosition_) return;
    const TextPosition position = layout_.getPositionForPoint(*lastTapDownPosition_);
    const TextRange word = layout_.getWordBoundary(position);
    TextSelection next;
    if (position.offset - word.start <= 1) {
        next = TextSelection::collapsed(word.start, TextAffinity::Downstream);
    } else {
        next = TextSelection::collapsed(word.end, TextAffinity::Upstream);
    }
    handleSelectionChange(next, cause);
}

void SelectionController::selectPositionAt(Point2 from, std::optional<Point2> to, SelectionChangedCause cause) {
    const TextPosition fromPosition = layout_.getPositionForPoint(from);
    int extentOffset = fromPosition.offset;
    if (to) {
        extentOffset = layout_.getPositionForPoint(*to).offset;
    }
    handleSelectionChange(TextSelection{fromPosition.offset, extentOffset, fromPosition.affinity}, cause);
}

void SelectionController::selectWordsInRange(Point2 from, std::optional<Point2> to, SelectionChangedCause cause) {
    const TextSelection firstWord = selectWordAtOffset(layout_.getPositionForPoint(from));
    const TextSelection lastWord = to ? selectWordAtOffset(layout_.getPositionForPoint(*to)) : firstWord;
    handleSelectionChange(TextSelection{firstWord.baseOffset, lastWord.extentOffset, firstWord.affinity}, cause);
}

// =============================================================================
// Drag
// =============================================================================

void SelectionController::dragStart(Point2 local, DragGranularity granularity) {
    dragOrigin_ = local;
    dragGranularity_ = granularity;
    if (granularity == DragGranularity::Word) {
        selectWordsInRange(local, std::nullopt, SelectionChangedCause::Drag);
    } else {
        selectPositionAt(local, std::nullopt, SelectionChangedCause::Drag);
    }
}

void SelectionController::dragUpdate(Point2 local) {
    if (!dragOrigin_) return;
    if (dragGranularity_ == DragGranularity::Word) {
        selectWordsInRange(*dragOrigin_, local, SelectionChangedCause::Drag);
    } else {
        selectPositionAt(*dragOrigin_, local, SelectionChangedCause::Drag);
    }
}

void SelectionController::dragEnd() {
    dragOrigin_.reset();
}

// =============================================================================
// Word and Line Selection
// =============================================================================

bool SelectionController::onlyWhitespace(TextRange range) const {
    return text::isWhitespaceOnly(layout_.plainText(), range);
}

std::optional<TextRange> SelectionController::nextWord(int offset) {
    while (true) {
        const TextRange range = layout_.getWordBoundary(TextPosition{offset});
        if (!range.isValid() || range.isCollapsed()) return std::nullopt;
        if (!onlyWhitespace(range)) return range;
        offset = range.end;
    }
}

std::optional<TextRange> SelectionController::previousWord(int offset) {
    while (offset >= 0) {
        const TextRange range = layout_.getWordBoundary(TextPosition{offset});
        if (!range.isValid() || range.isCollapsed()) return std::nullopt;
        if (!onlyWhitespace(range)) return range;
        offset = range.start - 1;
    }
    return std::nullopt;
}

TextSelection SelectionController::selectWordAtOffset(TextPosition position) {
    const TextRange word = layout_.getWordBoundary(position);
    if (position.offset >= word.end) {
        return TextSelection::fromPosition(position);
    }
    const render::EditableConfig& config = layout_.config();
    const std::u16string& text = layout_.plainText();
    if (config.obscureText) {
        return TextSelection{0, static_cast<int>(text.size())};
    }

    const bool onWhitespace = position.offset > 0 &&
        isWhitespaceCodePoint(static_cast<char32_t>(text[static_cast<std::size_t>(position.offset)]));
    const bool extendBack = config.previousWordPolicy == PreviousWordPolicy::Always ||
        (config.previousWordPolicy == PreviousWordPolicy::WhenReadOnly && config.readOnly);
    if (onWhitespace && extendBack) {
        const std::optional<TextRange> previous = previousWord(word.start);
        const int start = previous ? previous->start : word.start;
        return TextSelection{start, position.offset};
    }
    return TextSelection{word.start, word.end};
}

TextSelection SelectionController::selectLineAtOffset(TextPosition position) {
    const TextRange line = layout_.getLineBoundary(position);
    if (position.offset >= line.end) {
        return TextSelection::fromPosition(position);
    }
    if (layout_.config().obscureText) {
        return TextSelection{0, layout_.textLength()};
    }
    return TextSelection{line.start, line.end};
}

// =============================================================================
// Accessibility Moves
// =============================================================================

void SelectionController::moveCursorForwardByCharacter(bool extendSelection) {
    const TextSelection& selection = layout_.selection();
    if (!selection.isValid()) return;
    const std::optional<int> extentOffset = layout_.getOffsetAfter(selection.extentOffset);
    if (!extentOffset) return;
    const int baseOffset = extendSelection ? selection.baseOffset : *extentOffset;
    handleSelectionChange(TextSelection{baseOffset, *extentOffset}, SelectionChangedCause::Keyboard);
}

void SelectionController::moveCursorBackwardByCharacter(bool extendSelection) {
    const TextSelection& selection = layout_.selection();
    if (!selection.isValid()) return;
    const std::optional<int> extentOffset = layout_.getOffsetBefore(selection.extentOffset);
    if (!extentOffset) return;
    const int baseOffset = extendSelection ? selection.baseOffset : *extentOffset;
    handleSelectionChange(TextSelection{baseOffset, *extentOffset}, SelectionChangedCause::Keyboard);
}

void SelectionController::moveCursorForwardByWord(bool extendSelection) {
    const TextSelection selection = layout_.selection();
    if (!selection.isValid()) return;
    const TextRange currentWord = layout_.getWordBoundary(selection.extent());
    const std::optional<TextRange> next = nextWord(currentWord.end);
    if (!next) return;
    const int baseOffset = extendSelection ? selection.baseOffset : next->start;
    handleSelectionChange(TextSelection{baseOffset, next->start}, SelectionChangedCause::Keyboard);
}

void SelectionController::moveCursorBackwardByWord(bool extendSelection) {
    const TextSelection selection = layout_.selection();
    if (!selection.isValid()) return;
    const TextRange currentWord = layout_.getWordBoundary(selection.extent());
    const std::optional<TextRange> previous = previousWord(currentWord.start - 1);
    if (!previous) return;
    const int baseOffset = extendSelection ? selection.baseOffset : previous->start;
    handleSelectionChange(TextSelection{baseOffset, previous->start}, SelectionChangedCause::Keyboard);
}

// =============================================================================
// Character Navigation
// =============================================================================

int SelectionController::nextCharacter(int index, std::u16string_view text, bool includeWhitespace) {
    const int length = static_cast<int>(text.size());
    if (index >= length) {
        return length;
    }
    std::uint32_t pos = text::nextGraphemeBoundary(text, static_cast<std::uint32_t>(std::max(index, 0)));
    if (!includeWhitespace) {
        while (pos < text.size()) {
            std::uint32_t unitLen = 0;
            if (!isWhitespaceCodePoint(decodeUtf16At(text, pos, unitLen))) break;
            pos = text::nextGraphemeBoundary(text, pos);
        }
    }
    return static_cast<int>(pos);
}

int SelectionController::previousCharacter(int index, std::u16string_view text, bool includeWhitespace) {
    if (index <= 0) {
        return 0;
    }
    int lastNonWhitespace = -1;
    std::uint32_t start = 0;
    while (start < text.size()) {
        const std::uint32_t end = text::nextGraphemeBoundary(text, start);
        if (!includeWhitespace) {
            std::uint32_t unitLen = 0;
            if (!isWhitespaceCodePoint(decodeUtf16At(text, start, unitLen))) {
                lastNonWhitespace = static_cast<int>(start);
            }
        }
        if (static_cast<int>(end) >= index) {
            if (includeWhitespace) return static_cast<int>(start);
            return lastNonWhitespace >= 0 ? lastNonWhitespace : 0;
        }
        start = end;
    }
    return 0;
}

} // namespace richedit::interaction
