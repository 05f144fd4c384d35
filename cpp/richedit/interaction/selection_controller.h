#ifndef RICHEDIT_INTERACTION_SELECTION_CONTROLLER_H
#define RICHEDIT_INTERACTION_SELECTION_CONTROLLER_H

#include "richedit/core/types.h"
#include "richedit/editing/editing_value.h"
#include "richedit/interaction/input_collaborators.h"
#include "richedit/interaction/interaction_types.h"
#include "richedit/render/editable_layout.h"
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace richedit::interaction {

using editing::TextSelection;
using text::TextPosition;
using text::TextRange;

/**
 * SelectionController: turns pointer gestures, key events and
 * accessibility moves into selection changes for one editable.
 *
 * States: Idle and Dragging(origin). Every change goes through one choke
 * point that drops a change equal to the current selection, except for
 * keyboard changes and the focusing-empty change (0, 0) on an unfocused
 * editable, which are always reported.
 *
 * Pointer positions are editable-local. Geometry queries go to the
 * EditableLayout, which must be laid out.
 */
class SelectionController {
public:
    using SelectionChangedHandler = std::function<void(const TextSelection&, SelectionChangedCause)>;

    /**
     * @param delegate Live value for shortcuts and delete (may be null: those keys are ignored)
     * @param clipboard May be null: copy/cut/paste are ignored
     */
    SelectionController(render::EditableLayout& layout, TextSelectionDelegate* delegate, Clipboard* clipboard);

    SelectionController(const SelectionController&) = delete;
    SelectionController& operator=(const SelectionController&) = delete;

    void setOnSelectionChanged(SelectionChangedHandler handler) { onSelectionChanged_ = std::move(handler); }
    void setDelegate(TextSelectionDelegate* delegate) { delegate_ = delegate; }
    void setClipboard(Clipboard* clipboard) { clipboard_ = clipboard; }

    // =========================================================================
    // Gestures
    // =========================================================================

    void handleTapDown(Point2 local) { lastTapDownPosition_ = local; }
    void handleSecondaryTapDown(Point2 local) { lastSecondaryTapDownPosition_ = local; }
    std::optional<Point2> lastTapDownPosition() const { return lastTapDownPosition_; }
    std::optional<Point2> lastSecondaryTapDownPosition() const { return lastSecondaryTapDownPosition_; }

    void handleTap() { selectPosition(SelectionChangedCause::Tap); }
    void handleDoubleTap() { selectWord(SelectionChangedCause::DoubleTap); }
    void handleLongPress() { selectWord(SelectionChangedCause::LongPress); }

    // Selection at the last tap-down position. No-op without one.
    void selectPosition(SelectionChangedCause cause);
    void selectWord(SelectionChangedCause cause);
    void selectWordEdge(SelectionChangedCause cause);

    /**
     * Select from the position under `from` to the position under `to`
     * (collapsed at `from` when `to` is unset).
     */
    void selectPositionAt(Point2 from, std::optional<Point2> to, SelectionChangedCause cause);

    /**
     * Base at the start of the word under `from`, extent at the end of the
     * word under `to` (or `from`).
     */
    void selectWordsInRange(Point2 from, std::optional<Point2> to, SelectionChangedCause cause);

    // =========================================================================
    // Drag
    // =========================================================================

    void dragStart(Point2 local, DragGranularity granularity = DragGranularity::Character);
    void dragUpdate(Point2 local);
    void dragEnd();

    bool isDragging() const { return dragOrigin_.has_value(); }
    std::optional<Point2> dragOrigin() const { return dragOrigin_; }

    // =========================================================================
    // Word and Line Selection
    // =========================================================================

    /**
     * Word around `position`. Collapsed at `position` past the word end;
     * the whole text when obscured. On whitespace, extends back to the
     * previous word when the previous-word policy allows it.
     */
    TextSelection selectWordAtOffset(TextPosition position);

    /**
     * Line around `position`; collapsed past the line end, whole text when obscured.
     */
    TextSelection selectLineAtOffset(TextPosition position);

    // =========================================================================
    // Keyboard (selection_keyboard.cpp)
    // =========================================================================

    /**
     * @return True when the event changed or attempted to change the
     *         selection or text
     */
    bool handleKeyEvent(const KeyEvent& event);

    int cursorResetLocation() const { return cursorResetLocation_; }
    bool wasSelectingVerticallyWithKeyboard() const { return wasSelectingVerticallyWithKeyboard_; }

    // =========================================================================
    // Accessibility Moves
    // =========================================================================

    void moveCursorForwardByCharacter(bool extendSelection);
    void moveCursorBackwardByCharacter(bool extendSelection);
    void moveCursorForwardByWord(bool extendSelection);
    void moveCursorBackwardByWord(bool extendSelection);

    // =========================================================================
    // Selection Change
    // =========================================================================

    /**
     * The choke point every selection change goes through.
     * @return True when the change was reported
     */
    bool handleSelectionChange(const TextSelection& next, SelectionChangedCause cause);

    // =========================================================================
    // Character Navigation
    // =========================================================================

    /**
     * End of the grapheme containing `index`, then past any whitespace
     * graphemes unless `includeWhitespace`.
     */
    static int nextCharacter(int index, std::u16string_view text, bool includeWhitespace = true);

    /**
     * Start of the grapheme ending at or containing `index`. Without
     * `includeWhitespace`, the start of the last non-whitespace grapheme
     * before it (0 when there is none).
     */
    static int previousCharacter(int index, std::u16string_view text, bool includeWhitespace = true);

private:
    std::optional<TextRange> nextWord(int offset);
    std::optional<TextRange> previousWord(int offset);
    bool onlyWhitespace(TextRange range) const;

    void handleMovement(const KeyEvent& event, bool wordModifier, bool lineModifier);
    void handleShortcut(LogicalKey key);
    void handleDelete(bool forward);
    void pasteFromClipboard();

    render::EditableLayout& layout_;
    TextSelectionDelegate* delegate_;
    Clipboard* clipboard_;
    SelectionChangedHandler onSelectionChanged_;

    std::optional<Point2> lastTapDownPosition_;
    std::optional<Point2> lastSecondaryTapDownPosition_;

    std::optional<Point2> dragOrigin_;
    DragGranularity dragGranularity_ = DragGranularity::Character;

    int cursorResetLocation_ = -1;
    bool wasSelectingVerticallyWithKeyboard_ = false;

    // Expires with the controller; pending clipboard reads check it
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace richedit::interaction

#endif // RICHEDIT_INTERACTION_SELECTION_CONTROLLER_H
