#ifndef RICHEDIT_RICH_EDITABLE_H
#define RICHEDIT_RICH_EDITABLE_H

#include "richedit/animation/animation_controller.h"
#include "richedit/animation/caret_blink.h"
#include "richedit/animation/floating_cursor.h"
#include "richedit/core/post_layout_queue.h"
#include "richedit/core/types.h"
#include "richedit/core/util.h"
#include "richedit/editing/editing_controller.h"
#include "richedit/interaction/input_collaborators.h"
#include "richedit/interaction/interaction_types.h"
#include "richedit/interaction/selection_controller.h"
#include "richedit/render/editable_config.h"
#include "richedit/render/editable_layout.h"
#include "richedit/render/editable_painters.h"
#include "richedit/text/inline_object_codec.h"
#include "richedit/text/span_builder.h"
#include "richedit/text/text_shaper.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace richedit {

// Number of blink ticks an obscured field shows the character just typed.
constexpr int kObscureShowLatestCharCursorTicks = 3;

struct RichEditableConfig {
    render::EditableConfig editable;
    animation::CaretBlinkConfig caretBlink;
    animation::FloatingCursorConfig floatingCursor;
    text::SpanBuildOptions inlineObjects;
    double caretScrollDurationMs = 100.0;
};

/**
 * RichEditable: one editable field assembled from the controller, layout,
 * selection, animation and painting pieces.
 *
 * Responsibilities:
 * - Mirror the controller's value into the layout (obscured or span-built)
 * - Act as the IME client: updateEditingValue, performAction,
 *   updateFloatingCursor, connectionClosed
 * - Act as the selection delegate for shortcuts and delete
 * - Focus handling (input connection, caret blink)
 * - Scroll the caret on screen after layout, through the post-layout queue
 * - Install the prompt-rect, selection and caret painters
 *
 * Time comes from the clock (monotonicNowMs unless replaced). The host calls
 * layout(), paint(), flushPostLayout() after painting, and advance() every
 * frame while animations run.
 *
 * The controller must outlive the editable.
 */
class RichEditable : public interaction::TextSelectionDelegate {
public:
    using Clock = std::function<double()>;
    using ChangedCallback = std::function<void(const std::u16string&)>;
    using SubmittedCallback = std::function<void(const std::u16string&)>;
    using EditingCompleteCallback = std::function<void()>;
    using SelectionChangedCallback =
        std::function<void(const editing::TextSelection&, std::optional<interaction::SelectionChangedCause>)>;

    /**
     * @throws std::invalid_argument if `config.editable` is invalid
     */
    RichEditable(editing::EditingController& controller, text::TextShaper* shaper, RichEditableConfig config = RichEditableConfig{});
    ~RichEditable() override;

    RichEditable(const RichEditable&) = delete;
    RichEditable& operator=(const RichEditable&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    void setStyle(const text::TextStyle& style);
    void setResolver(text::InlineContentResolver resolver);
    void setClipboard(interaction::Clipboard* clipboard);
    void setTextInputService(interaction::TextInputService* service) { inputService_ = service; }
    void setClock(Clock clock) { clock_ = std::move(clock); }

    /**
     * @throws std::invalid_argument if the editable config is invalid
     */
    void setConfig(const RichEditableConfig& config);
    const RichEditableConfig& config() const { return config_; }

    void setOnChanged(ChangedCallback callback) { onChanged_ = std::move(callback); }
    void setOnSubmitted(SubmittedCallback callback) { onSubmitted_ = std::move(callback); }
    void setOnEditingComplete(EditingCompleteCallback callback) { onEditingComplete_ = std::move(callback); }
    void setOnSelectionChanged(SelectionChangedCallback callback) { onSelectionChanged_ = std::move(callback); }

    // =========================================================================
    // Frame
    // =========================================================================

    void layout(const render::BoxConstraints& constraints);
    void paint(render::Canvas& canvas, Point2 offset);

    /**
     * Run the post-layout callbacks (scroll caret into view).
     */
    std::size_t flushPostLayout() { return postLayout_.flush(); }

    /**
     * Advance the caret blink, floating-cursor reset and caret scroll.
     * @return True if anything visible changed
     */
    bool advance(double nowMs);

    // =========================================================================
    // Focus
    // =========================================================================

    void setFocus(bool focused);
    bool hasFocus() const { return hasFocus_; }

    /**
     * Focus the field, or show the keyboard when it is already focused.
     */
    void requestKeyboard();

    bool hasInputConnection() const { return connection_ && connection_->attached(); }

    // =========================================================================
    // Text Input Client
    // =========================================================================

    void updateEditingValue(const editing::EditingValue& value);
    void performAction(interaction::TextInputAction action);
    void updateFloatingCursor(const animation::RawFloatingCursorPoint& point);
    void connectionClosed();

    /**
     * Highlight [start, end) as an autocorrect candidate until the text changes.
     */
    void showAutocorrectionPromptRect(int start, int end);
    const std::optional<text::TextRange>& promptRectRange() const { return promptRectRange_; }

    // =========================================================================
    // Selection
    // =========================================================================

    interaction::SelectionController& selectionController() { return selectionController_; }
    bool handleKeyEvent(const interaction::KeyEvent& event) { return selectionController_.handleKeyEvent(event); }

    /**
     * Scroll so the caret at `position` is visible (no animation).
     */
    void bringIntoView(text::TextPosition position);

    // TextSelectionDelegate
    const editing::EditingValue& textEditingValue() const override { return controller_.value(); }
    void setTextEditingValue(const editing::EditingValue& value) override;
    bool copyEnabled() const override;
    bool cutEnabled() const override;
    bool pasteEnabled() const override;
    bool selectAllEnabled() const override { return true; }

    // =========================================================================
    // State
    // =========================================================================

    render::EditableLayout& renderEditable() { return layout_; }
    const render::EditableLayout& renderEditable() const { return layout_; }
    const animation::CaretBlink& caretBlink() const { return blink_; }
    const animation::FloatingCursorAnimator& floatingCursor() const { return floatingCursor_; }
    const PostLayoutQueue& postLayoutQueue() const { return postLayout_; }

    /**
     * The text handed to layout: the controller's text, or the obscured rendition.
     */
    const std::u16string& displayText() const { return layout_.plainText(); }
    int obscureLatestCharIndex() const { return obscureLatestCharIndex_; }

    float scrollOffset() const { return layout_.scrollOffset(); }
    std::optional<Rect> currentCaretRect() const { return currentCaretRect_; }

    /**
     * Scroll offset that keeps `caretRect` (local) inside the viewport.
     */
    float scrollOffsetForCaret(const Rect& caretRect) const;

private:
    double now() const { return clock_ ? clock_() : monotonicNowMs(); }

    void didChangeTextEditingValue();
    void syncContent();
    void installPainters();
    void updatePainters();

    void formatAndSetValue(editing::EditingValue value);
    void updateRemoteEditingValueIfNeeded();
    void handleSelectionChanged(const editing::TextSelection& selection, std::optional<interaction::SelectionChangedCause> cause);
    void handleCaretChanged(const Rect& caretRect);
    void showCaretOnScreen();
    void finalizeEditing(bool shouldUnfocus);

    void openInputConnection();
    void closeInputConnectionIfNeeded();
    void startOrStopCursorTimerIfNeeded();

    editing::EditingController& controller_;
    RichEditableConfig config_;
    text::TextStyle style_;
    text::InlineContentResolver resolver_;
    Clock clock_;

    render::EditableLayout layout_;
    interaction::SelectionController selectionController_;
    animation::CaretBlink blink_;
    animation::FloatingCursorAnimator floatingCursor_;
    animation::AnimationController scrollAnimation_;
    PostLayoutQueue postLayout_;

    std::shared_ptr<render::TextHighlightPainter> promptPainter_;
    std::shared_ptr<render::TextHighlightPainter> selectionPainter_;
    std::shared_ptr<render::CaretPainter> caretPainter_;
    std::unique_ptr<render::CompositePainter> background_;
    std::unique_ptr<render::CompositePainter> foreground_;

    interaction::TextInputService* inputService_ = nullptr;
    std::unique_ptr<interaction::TextInputConnection> connection_;

    ChangedCallback onChanged_;
    SubmittedCallback onSubmitted_;
    EditingCompleteCallback onEditingComplete_;
    SelectionChangedCallback onSelectionChanged_;

    editing::EditingController::SubscriptionHandle subscription_ = 0;
    bool hasFocus_ = false;

    // IME repeat-pass detection
    std::optional<editing::EditingValue> lastFormattedUnmodifiedValue_;
    std::optional<editing::EditingValue> lastFormattedValue_;
    std::optional<editing::EditingValue> receivedRemoteValue_;

    std::optional<text::TextRange> promptRectRange_;
    int obscureLatestCharIndex_ = -1;

    std::optional<Rect> currentCaretRect_;
    bool textChangedSinceLastCaretUpdate_ = false;
    bool showCaretOnScreenScheduled_ = false;
};

} // namespace richedit

#endif // RICHEDIT_RICH_EDITABLE_H
