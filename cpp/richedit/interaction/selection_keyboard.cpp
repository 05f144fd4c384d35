#include "richedit/interaction/selection_controller.h"

#include "richedit/core/logging.h"
#include "richedit/core/util.h"

#include <algorithm>
#include <string>

namespace richedit::interaction {

using render::KeyboardFlavor;

namespace {

bool isMovementKey(LogicalKey key) {
    return key == LogicalKey::ArrowLeft || key == LogicalKey::ArrowRight ||
           key == LogicalKey::ArrowUp || key == LogicalKey::ArrowDown;
}

bool isShortcutKey(LogicalKey key) {
    return key == LogicalKey::KeyA || key == LogicalKey::KeyC ||
           key == LogicalKey::KeyV || key == LogicalKey::KeyX;
}

} // namespace

bool SelectionController::handleKeyEvent(const KeyEvent& event) {
    if (!event.down || event.key == LogicalKey::Other) {
        return false;
    }

    const bool macOS = layout_.config().keyboardFlavor == KeyboardFlavor::MacOS;
    const bool wordModifier = macOS ? event.alt : event.control;
    const bool lineModifier = macOS ? event.meta : event.alt;
    const bool shortcutModifier = macOS ? event.meta : event.control;

    if (isMovementKey(event.key)) {
        handleMovement(event, wordModifier, lineModifier);
        return true;
    }
    if (shortcutModifier && isShortcutKey(event.key)) {
        handleShortcut(event.key);
        return true;
    }
    if (event.key == LogicalKey::Delete) {
        handleDelete(true);
        return true;
    }
    if (event.key == LogicalKey::Backspace) {
        handleDelete(false);
        return true;
    }
    return false;
}

// =============================================================================
// Movement
// =============================================================================

void SelectionController::handleMovement(const KeyEvent& event, bool wordModifier, bool lineModifier) {
    // Word and line movement at once is ambiguous
    if (wordModifier && lineModifier) {
        return;
    }
    const TextSelection selection = layout_.selection();
    if (!selection.isValid()) {
        return;
    }

    const std::u16string& text = layout_.plainText();
    const int length = static_cast<int>(text.size());
    const bool shift = event.shift;
    const bool rightArrow = event.key == LogicalKey::ArrowRight;
    const bool leftArrow = event.key == LogicalKey::ArrowLeft;
    const bool upArrow = event.key == LogicalKey::ArrowUp;
    const bool downArrow = event.key == LogicalKey::ArrowDown;

    TextSelection next = selection;

    if (rightArrow || leftArrow) {
        if (wordModifier) {
            if (leftArrow) {
                const int startPoint = previousCharacter(next.extentOffset, text, false);
                next = next.withExtent(selectWordAtOffset(TextPosition{startPoint}).baseOffset);
            } else {
                const int startPoint = nextCharacter(next.extentOffset, text, false);
                next = next.withExtent(selectWordAtOffset(TextPosition{startPoint}).extentOffset);
            }
        } else if (lineModifier) {
            if (leftArrow) {
                const int startPoint = previousCharacter(next.extentOffset, text, false);
                next = next.withExtent(selectLineAtOffset(TextPosition{startPoint}).baseOffset);
            } else {
                const int startPoint = nextCharacter(next.extentOffset, text, false);
                next = next.withExtent(selectLineAtOffset(TextPosition{startPoint}).extentOffset);
            }
        } else if (rightArrow && next.extentOffset < length) {
            const int nextExtent = (!shift && !next.isCollapsed()) ? next.end() : nextCharacter(next.extentOffset, text);
            const int distance = nextExtent - next.extentOffset;
            next = next.withExtent(nextExtent);
            if (shift) cursorResetLocation_ += distance;
        } else if (leftArrow && next.extentOffset > 0) {
            const int previousExtent = (!shift && !next.isCollapsed()) ? next.start() : previousCharacter(next.extentOffset, text);
            const int distance = next.extentOffset - previousExtent;
            next = next.withExtent(previousExtent);
            if (shift) cursorResetLocation_ -= distance;
        }
    }

    if (upArrow || downArrow) {
        if (lineModifier) {
            if (upArrow) {
                const int upperOffset = std::max(0, std::max(next.baseOffset, next.extentOffset));
                next = TextSelection{shift ? upperOffset : 0, 0};
            } else {
                const int lowerOffset = std::max(0, std::min(next.baseOffset, next.extentOffset));
                next = TextSelection{shift ? lowerOffset : length, length};
            }
        } else {
            // Probe the middle of the neighbouring line
            const float lineHeight = layout_.preferredLineHeight();
            const float verticalOffset = upArrow ? -0.5f * lineHeight : 1.5f * lineHeight;
            const Point2 caretOffset = layout_.getOffsetForCaret(TextPosition{next.extentOffset}, layout_.caretPrototype());
            const TextPosition position = layout_.getPositionForOffset(caretOffset + Point2{0.0f, verticalOffset});

            if (position.offset == next.extentOffset) {
                next = next.withExtent(downArrow ? length : 0);
                wasSelectingVerticallyWithKeyboard_ = shift;
            } else if (wasSelectingVerticallyWithKeyboard_ && shift) {
                next = next.withExtent(clampI(cursorResetLocation_, 0, length));
                wasSelectingVerticallyWithKeyboard_ = false;
            } else {
                next = next.withExtent(position.offset);
                cursorResetLocation_ = next.extentOffset;
            }
        }
    }

    // Collapse unless extending, at the selection edge in the arrow direction
    if (!shift || !layout_.config().selectionEnabled) {
        int offset = next.extentOffset;
        if (!selection.isCollapsed()) {
            if (leftArrow) {
                offset = std::min(next.baseOffset, next.extentOffset);
            } else if (rightArrow) {
                offset = std::max(next.baseOffset, next.extentOffset);
            }
        }
        next = TextSelection::collapsed(offset);
    }

    handleSelectionChange(next, SelectionChangedCause::Keyboard);
    if (delegate_) {
        editing::EditingValue value = delegate_->textEditingValue();
        value.selection = next;
        delegate_->setTextEditingValue(value);
    }
}

// =============================================================================
// Shortcuts
// =============================================================================

void SelectionController::handleShortcut(LogicalKey key) {
    if (!delegate_) {
        return;
    }
    const editing::EditingValue& value = delegate_->textEditingValue();
    const TextSelection selection = value.selection;
    const bool readOnly = layout_.config().readOnly;

    switch (key) {
        case LogicalKey::KeyC:
            if (clipboard_ && delegate_->copyEnabled() && selection.isValid() && !selection.isCollapsed()) {
                clipboard_->write(selection.range().textInside(value.text));
            }
            return;
        case LogicalKey::KeyX:
            if (readOnly || !clipboard_ || !delegate_->cutEnabled() || !selection.isValid() || selection.isCollapsed()) {
                return;
            }
            {
                const TextRange range = selection.range();
                clipboard_->write(range.textInside(value.text));
                editing::EditingValue next;
                next.text = range.textBefore(value.text) + range.textAfter(value.text);
                next.selection = TextSelection::collapsed(range.start);
                delegate_->setTextEditingValue(next);
            }
            return;
        case LogicalKey::KeyV:
            if (!readOnly && clipboard_ && delegate_->pasteEnabled()) {
                pasteFromClipboard();
            }
            return;
        case LogicalKey::KeyA:
            if (delegate_->selectAllEnabled()) {
                const TextSelection all{0, static_cast<int>(value.text.size()), selection.affinity, selection.isDirectional};
                handleSelectionChange(all, SelectionChangedCause::Keyboard);
            }
            return;
        default:
            return;
    }
}

void SelectionController::pasteFromClipboard() {
    std::weak_ptr<bool> alive = alive_;
    clipboard_->read([this, alive](std::optional<std::u16string> data) {
        if (alive.expired()) {
            RICHEDIT_LOG_DEBUG("clipboard data arrived after the editable was torn down");
            return;
        }
        if (!data || !delegate_) {
            return;
        }
        // Apply to the value as it is now, which may have changed while waiting
        const editing::EditingValue& value = delegate_->textEditingValue();
        const TextSelection selection = value.selection;
        if (!selection.isValid()) {
            RICHEDIT_LOG_DEBUG("paste dropped: no selection");
            return;
        }
        const TextRange range = selection.range();
        editing::EditingValue next;
        next.text = range.textBefore(value.text) + *data + range.textAfter(value.text);
        next.selection = TextSelection::collapsed(range.start + static_cast<int>(data->size()));
        delegate_->setTextEditingValue(next);
    });
}

// =============================================================================
// Delete
// =============================================================================

void SelectionController::handleDelete(bool forward) {
    if (!delegate_ || layout_.config().readOnly) {
        return;
    }
    const editing::EditingValue& value = delegate_->textEditingValue();
    const TextSelection selection = value.selection;
    if (!selection.isValid()) {
        return;
    }

    const TextRange range = selection.range();
    std::u16string textBefore = range.textBefore(value.text);
    std::u16string textAfter = range.textAfter(value.text);
    int cursorPosition = range.start;

    if (selection.isCollapsed()) {
        if (!forward && !textBefore.empty()) {
            const int boundary = previousCharacter(static_cast<int>(textBefore.size()), textBefore);
            textBefore.resize(static_cast<std::size_t>(boundary));
            cursorPosition = boundary;
        }
        if (forward && !textAfter.empty()) {
            const int deleteCount = nextCharacter(0, textAfter);
            textAfter.erase(0, static_cast<std::size_t>(deleteCount));
        }
    }

    const TextSelection next = TextSelection::collapsed(cursorPosition);
    if (selection != next) {
        handleSelectionChange(next, SelectionChangedCause::Keyboard);
    }
    editing::EditingValue updated;
    updated.text = textBefore + textAfter;
    updated.selection = next;
    delegate_->setTextEditingValue(updated);
}

} // namespace richedit::interaction
