#include "richedit/rich_editable.h"

#include "richedit/core/logging.h"

#include <algorithm>

namespace richedit {

using editing::EditingValue;
using editing::TextSelection;
using interaction::SelectionChangedCause;
using interaction::TextInputAction;
using text::TextPosition;
using text::TextRange;

RichEditable::RichEditable(editing::EditingController& controller, text::TextShaper* shaper, RichEditableConfig config)
    : controller_(controller),
      config_(config),
      layout_(shaper, config.editable),
      selectionController_(layout_, this, nullptr),
      blink_(config.caretBlink),
      floatingCursor_(layout_, config.floatingCursor) {
    controller_.setDirectionalityNormalization(config_.editable.textDirection);

    selectionController_.setOnSelectionChanged([this](const TextSelection& selection, SelectionChangedCause cause) {
        handleSelectionChanged(selection, cause);
    });
    floatingCursor_.setOnCommit([this](TextPosition position) {
        handleSelectionChanged(TextSelection::collapsed(position.offset), SelectionChangedCause::ForcePress);
    });

    installPainters();
    subscription_ = controller_.subscribe([this](const EditingValue&) { didChangeTextEditingValue(); });
    syncContent();
}

RichEditable::~RichEditable() {
    controller_.unsubscribe(subscription_);
    postLayout_.cancelAll();
    closeInputConnectionIfNeeded();
}

// =============================================================================
// Setup
// =============================================================================

void RichEditable::setStyle(const text::TextStyle& style) {
    style_ = style;
    layout_.setStyle(style);
    syncContent();
    if (hasInputConnection()) {
        connection_->setStyle(style_, config_.editable.textDirection, config_.editable.textAlign);
    }
}

void RichEditable::setResolver(text::InlineContentResolver resolver) {
    resolver_ = std::move(resolver);
    syncContent();
}

void RichEditable::setClipboard(interaction::Clipboard* clipboard) {
    selectionController_.setClipboard(clipboard);
}

void RichEditable::setConfig(const RichEditableConfig& config) {
    layout_.setConfig(config.editable);
    config_ = config;
    blink_.setConfig(config.caretBlink);
    controller_.setDirectionalityNormalization(config_.editable.textDirection);
    if (config_.editable.readOnly) {
        closeInputConnectionIfNeeded();
    }
    installPainters();
    syncContent();
}

// =============================================================================
// Content
// =============================================================================

void RichEditable::syncContent() {
    const EditingValue& value = controller_.value();
    if (config_.editable.obscureText) {
        // One obscuring unit per code unit keeps offsets aligned with the real text
        std::u16string obscured(value.text.size(), config_.editable.obscuringCharacter);
        const int index = obscureLatestCharIndex_;
        if (blink_.obscureShowCharTicksPending() > 0 && index >= 0 && index < static_cast<int>(obscured.size())) {
            obscured[static_cast<std::size_t>(index)] = value.text[static_cast<std::size_t>(index)];
        }
        std::vector<text::Span> spans = text::buildSpans(obscured, style_, text::InlineContentResolver{});
        layout_.setContent(std::move(obscured), std::move(spans));
    } else {
        // Read-only text is never shown as composing
        const bool withComposing = !config_.editable.readOnly;
        layout_.setContent(value.text, controller_.buildSpans(style_, resolver_, withComposing, config_.inlineObjects));
    }
    layout_.setSelection(value.selection);
    updatePainters();
}

void RichEditable::didChangeTextEditingValue() {
    updateRemoteEditingValueIfNeeded();
    startOrStopCursorTimerIfNeeded();
    textChangedSinceLastCaretUpdate_ = true;
    syncContent();
}

// =============================================================================
// Painters
// =============================================================================

void RichEditable::installPainters() {
    if (!promptPainter_) {
        promptPainter_ = std::make_shared<render::TextHighlightPainter>();
        selectionPainter_ = std::make_shared<render::TextHighlightPainter>();
        caretPainter_ = std::make_shared<render::CaretPainter>();
        caretPainter_->setOnCaretPainted([this](const Rect& rect) { handleCaretChanged(rect); });
    }

    std::vector<std::shared_ptr<render::EditablePainter>> background{promptPainter_, selectionPainter_};
    std::vector<std::shared_ptr<render::EditablePainter>> foreground;
    if (config_.editable.paintCursorAboveText) {
        foreground.push_back(caretPainter_);
    } else {
        background.push_back(caretPainter_);
    }
    background_ = std::make_unique<render::CompositePainter>(std::move(background));
    foreground_ = std::make_unique<render::CompositePainter>(std::move(foreground));
}

void RichEditable::updatePainters() {
    const render::EditableConfig& editable = config_.editable;

    promptPainter_->setHighlightColor(editable.promptRectColor);
    promptPainter_->setHighlightedRange(promptRectRange_);

    const TextSelection& selection = controller_.selection();
    selectionPainter_->setHighlightColor(editable.selectionColor);
    selectionPainter_->setSelectionHeightStyle(editable.selectionHeightStyle);
    selectionPainter_->setSelectionWidthStyle(editable.selectionWidthStyle);
    selectionPainter_->setHighlightedRange(selection.isValid() ? std::optional<TextRange>(selection.range()) : std::nullopt);

    caretPainter_->setCaretColor(editable.cursorColor.withOpacity(blink_.opacity()));
    caretPainter_->setBackgroundCursorColor(editable.backgroundCursorColor);
    caretPainter_->setCursorRadius(editable.cursorRadius);
    caretPainter_->setCursorOffset(editable.cursorOffset);
    caretPainter_->setShouldPaint(editable.showCursor && hasFocus_ && blink_.currentlyVisible());
}

// =============================================================================
// Frame
// =============================================================================

void RichEditable::layout(const render::BoxConstraints& constraints) {
    layout_.layout(constraints);
}

void RichEditable::paint(render::Canvas& canvas, Point2 offset) {
    updatePainters();
    render::paintEditable(canvas, offset, layout_, background_.get(), foreground_.get());
}

bool RichEditable::advance(double nowMs) {
    const int ticksBefore = blink_.obscureShowCharTicksPending();
    bool changed = blink_.advance(nowMs);
    if (config_.editable.obscureText && blink_.obscureShowCharTicksPending() != ticksBefore) {
        syncContent();
    }
    if (floatingCursor_.advance(nowMs)) {
        changed = true;
    }
    if (scrollAnimation_.tick(nowMs)) {
        layout_.setScrollOffset(scrollAnimation_.value());
        changed = true;
    }
    if (changed) {
        updatePainters();
    }
    return changed;
}

// =============================================================================
// Focus
// =============================================================================

void RichEditable::setFocus(bool focused) {
    if (hasFocus_ == focused) {
        return;
    }
    hasFocus_ = focused;
    layout_.setHasFocus(focused);

    if (focused) {
        openInputConnection();
    } else {
        closeInputConnectionIfNeeded();
        controller_.clearComposing();
    }
    startOrStopCursorTimerIfNeeded();

    if (focused) {
        showCaretOnScreen();
        if (!controller_.selection().isValid()) {
            // Caret at the end when focus arrives without a selection
            handleSelectionChanged(TextSelection::collapsed(static_cast<int>(controller_.text().size())), std::nullopt);
        }
    } else {
        EditingValue cleared;
        cleared.text = controller_.text();
        if (controller_.replace(std::move(cleared)) != EditError::Ok) {
            RICHEDIT_LOG_WARN("could not drop the selection on focus loss");
        }
        promptRectRange_.reset();
    }
    updatePainters();
}

void RichEditable::requestKeyboard() {
    if (hasFocus_) {
        openInputConnection();
    } else {
        setFocus(true);
    }
}

void RichEditable::openInputConnection() {
    if (config_.editable.readOnly) {
        return;
    }
    if (hasInputConnection()) {
        connection_->show();
        return;
    }
    if (!inputService_) {
        return;
    }
    const EditingValue& value = controller_.value();
    lastFormattedUnmodifiedValue_ = value;
    connection_ = inputService_->open();
    if (!connection_) {
        RICHEDIT_LOG_WARN("text input service did not open a connection");
        return;
    }
    connection_->show();
    connection_->setStyle(style_, config_.editable.textDirection, config_.editable.textAlign);
    connection_->setEditingState(value);
}

void RichEditable::closeInputConnectionIfNeeded() {
    if (!hasInputConnection()) {
        connection_.reset();
        return;
    }
    connection_->close();
    connection_.reset();
    lastFormattedUnmodifiedValue_.reset();
    receivedRemoteValue_.reset();
}

void RichEditable::connectionClosed() {
    if (!hasInputConnection()) {
        return;
    }
    connection_.reset();
    lastFormattedUnmodifiedValue_.reset();
    receivedRemoteValue_.reset();
    finalizeEditing(true);
}

void RichEditable::startOrStopCursorTimerIfNeeded() {
    const bool collapsed = controller_.selection().isCollapsed();
    if (!blink_.isRunning() && hasFocus_ && collapsed) {
        blink_.start(now());
    } else if (blink_.isRunning() && (!hasFocus_ || !collapsed)) {
        blink_.stop();
    }
}

// =============================================================================
// Text Input Client
// =============================================================================

void RichEditable::updateEditingValue(const EditingValue& value) {
    // Keyboard selection still works when read-only; text input does not
    if (config_.editable.readOnly) {
        return;
    }
    receivedRemoteValue_ = value;
    if (value.text != controller_.text()) {
        showCaretOnScreen();
        promptRectRange_.reset();
        if (config_.editable.obscureText && value.text.size() == controller_.text().size() + 1) {
            blink_.setObscureShowCharTicksPending(kObscureShowLatestCharCursorTicks);
            obscureLatestCharIndex_ = controller_.selection().baseOffset;
        }
    }

    formatAndSetValue(value);

    if (hasInputConnection()) {
        // Typing keeps the caret solid
        blink_.restart(now());
    }
    syncContent();
}

void RichEditable::formatAndSetValue(EditingValue value) {
    const bool textChanged = value.text != controller_.text();
    const bool isRepeat = lastFormattedUnmodifiedValue_ && value == *lastFormattedUnmodifiedValue_;

    EditingValue next;
    if (isRepeat && textChanged && lastFormattedValue_) {
        next = *lastFormattedValue_;
    } else {
        next = controller_.format(value);
        if (textChanged) {
            lastFormattedValue_ = next;
        }
    }

    if (controller_.commitFormatted(next) != EditError::Ok) {
        RICHEDIT_LOG_DEBUG("editing value rejected, keeping the previous one");
    }
    updateRemoteEditingValueIfNeeded();

    if (textChanged && onChanged_) {
        onChanged_(next.text);
    }
    lastFormattedUnmodifiedValue_ = receivedRemoteValue_;
}

void RichEditable::updateRemoteEditingValueIfNeeded() {
    if (!hasInputConnection()) {
        return;
    }
    const EditingValue& local = controller_.value();
    if (receivedRemoteValue_ && local == *receivedRemoteValue_) {
        return;
    }
    connection_->setEditingState(local);
}

void RichEditable::performAction(TextInputAction action) {
    switch (action) {
        case TextInputAction::Newline:
            // The newline is already in the text of a multiline field
            if (!layout_.isMultiline()) {
                finalizeEditing(true);
            }
            break;
        case TextInputAction::Done:
        case TextInputAction::Go:
        case TextInputAction::Send:
        case TextInputAction::Search:
            finalizeEditing(true);
            break;
        default:
            finalizeEditing(false);
            break;
    }
}

void RichEditable::finalizeEditing(bool shouldUnfocus) {
    if (onEditingComplete_) {
        onEditingComplete_();
    } else {
        controller_.clearComposing();
        if (shouldUnfocus) {
            setFocus(false);
        }
    }
    if (onSubmitted_) {
        onSubmitted_(controller_.text());
    }
}

void RichEditable::updateFloatingCursor(const animation::RawFloatingCursorPoint& point) {
    floatingCursor_.update(point, now());
}

void RichEditable::showAutocorrectionPromptRect(int start, int end) {
    promptRectRange_ = TextRange{start, end};
    updatePainters();
}

// =============================================================================
// Selection
// =============================================================================

void RichEditable::handleSelectionChanged(const TextSelection& selection, std::optional<SelectionChangedCause> cause) {
    // The text may have changed together with a gesture
    if (!controller_.isSelectionWithinTextBounds(selection)) {
        return;
    }
    if (controller_.setSelection(selection) != EditError::Ok) {
        return;
    }
    requestKeyboard();
    if (onSelectionChanged_) {
        onSelectionChanged_(selection, cause);
    }
}

void RichEditable::setTextEditingValue(const EditingValue& value) {
    formatAndSetValue(value);
}

bool RichEditable::copyEnabled() const {
    return !config_.editable.obscureText;
}

bool RichEditable::cutEnabled() const {
    return !config_.editable.readOnly && !config_.editable.obscureText;
}

bool RichEditable::pasteEnabled() const {
    return !config_.editable.readOnly;
}

// =============================================================================
// Scrolling
// =============================================================================

float RichEditable::scrollOffsetForCaret(const Rect& caretRect) const {
    float caretStart = 0.0f;
    float caretEnd = 0.0f;
    if (layout_.isMultiline()) {
        // Keep the whole line around the caret visible
        const float lineHeight = layout_.preferredLineHeight();
        const float caretOffset = (lineHeight - caretRect.height()) / 2.0f;
        caretStart = caretRect.top - caretOffset;
        caretEnd = caretRect.bottom + caretOffset;
    } else {
        caretStart = caretRect.left;
        caretEnd = caretRect.right;
    }

    float scrollOffset = layout_.scrollOffset();
    const float viewportExtent = layout_.viewportExtent();
    if (caretStart < 0.0f) {
        scrollOffset += caretStart;
    } else if (caretEnd >= viewportExtent) {
        scrollOffset += caretEnd - viewportExtent;
    }

    if (layout_.isMultiline()) {
        scrollOffset = clampF(scrollOffset, 0.0f, layout_.maxScrollExtent());
    }
    return scrollOffset;
}

void RichEditable::bringIntoView(TextPosition position) {
    scrollAnimation_.stop();
    layout_.setScrollOffset(scrollOffsetForCaret(layout_.getLocalRectForCaret(position)));
}

void RichEditable::handleCaretChanged(const Rect& caretRect) {
    currentCaretRect_ = caretRect;
    if (textChangedSinceLastCaretUpdate_) {
        textChangedSinceLastCaretUpdate_ = false;
        showCaretOnScreen();
    }
}

void RichEditable::showCaretOnScreen() {
    if (showCaretOnScreenScheduled_) {
        return;
    }
    showCaretOnScreenScheduled_ = true;
    postLayout_.schedule([this]() {
        showCaretOnScreenScheduled_ = false;
        if (!currentCaretRect_ || !layout_.hasLayout()) {
            return;
        }
        const float target = scrollOffsetForCaret(*currentCaretRect_);
        if (target == layout_.scrollOffset()) {
            return;
        }
        scrollAnimation_.setValue(layout_.scrollOffset());
        scrollAnimation_.animateTo(target, config_.caretScrollDurationMs, animation::Curve::FastOutSlowIn, now());
        if (!scrollAnimation_.isAnimating()) {
            layout_.setScrollOffset(scrollAnimation_.value());
        }
    });
}

} // namespace richedit
