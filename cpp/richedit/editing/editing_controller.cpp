#include "richedit/editing/editing_controller.h"

#include "richedit/core/logging.h"
#include "richedit/text/inline_object_codec.h"

#include <algorithm>
#include <stdexcept>

namespace richedit::editing {

EditingController::EditingController(std::u16string text) {
    value_.text = std::move(text);
}

// =============================================================================
// Observers
// =============================================================================

EditingController::SubscriptionHandle EditingController::subscribe(Observer observer) {
    const SubscriptionHandle handle = nextHandle_++;
    observers_.push_back(Subscription{handle, std::move(observer)});
    return handle;
}

bool EditingController::unsubscribe(SubscriptionHandle handle) {
    auto it = std::find_if(observers_.begin(), observers_.end(),
        [handle](const Subscription& s) { return s.handle == handle; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    return true;
}

void EditingController::notifyObservers() {
    // Copy: observers may unsubscribe while being notified
    const std::vector<Subscription> snapshot = observers_;
    for (const Subscription& s : snapshot) {
        if (s.observer) s.observer(value_);
    }
}

// =============================================================================
// Mutation
// =============================================================================

EditingValue EditingController::format(const EditingValue& proposed) {
    EditingValue result = proposed;
    if (result.text == value_.text) {
        return result;
    }
    for (const auto& formatter : formatters_) {
        if (formatter) result = formatter->formatEditUpdate(value_, result);
    }
    if (normalizer_) {
        result = normalizer_->formatEditUpdate(value_, result);
    }
    return result;
}

EditError EditingController::replace(EditingValue newValue) {
    if (validateValue(newValue) != EditError::Ok) {
        RICHEDIT_LOG_WARN("rejected value: selection (%d, %d) composing (%d, %d) for length %zu",
            newValue.selection.baseOffset, newValue.selection.extentOffset,
            newValue.composing.start, newValue.composing.end, newValue.text.size());
        return EditError::ValidationError;
    }

    return commitFormatted(format(newValue));
}

EditError EditingController::commitFormatted(EditingValue formatted) {
    if (validateValue(formatted) != EditError::Ok) {
        RICHEDIT_LOG_WARN("formatters produced an invalid value, keeping the previous one");
        return EditError::ValidationError;
    }

    if (notifying_) {
        queued_.push_back(std::move(formatted));
        return EditError::Ok;
    }
    commit(std::move(formatted));
    return EditError::Ok;
}

void EditingController::commit(EditingValue value) {
    if (value == value_) {
        return;
    }
    value_ = std::move(value);

    // Observers are host code and may throw. Unwinding drops the queued
    // mutations and reopens the controller.
    struct NotifyingGuard {
        bool& notifying;
        std::deque<EditingValue>& queued;
        ~NotifyingGuard() {
            notifying = false;
            queued.clear();
        }
    } guard{notifying_, queued_};

    notifying_ = true;
    notifyObservers();
    while (!queued_.empty()) {
        EditingValue next = std::move(queued_.front());
        queued_.pop_front();
        if (next == value_) continue;
        value_ = std::move(next);
        notifyObservers();
    }
}

void EditingController::setText(std::u16string text) {
    EditingValue next;
    next.text = std::move(text);
    next.selection = TextSelection::invalid();
    next.composing = TextRange::empty();
    replace(std::move(next));
}

EditError EditingController::setSelection(TextSelection selection) {
    if (!isSelectionWithinTextBounds(selection)) {
        RICHEDIT_LOG_WARN("selection (%d, %d) out of range for length %zu",
            selection.baseOffset, selection.extentOffset, value_.text.size());
        return EditError::ValidationError;
    }
    EditingValue next = value_;
    next.selection = selection;
    return replace(std::move(next));
}

void EditingController::clear() {
    EditingValue next;
    next.selection = TextSelection::collapsed(0);
    replace(std::move(next));
}

void EditingController::clearComposing() {
    EditingValue next = value_;
    next.composing = TextRange::empty();
    replace(std::move(next));
}

bool EditingController::isSelectionWithinTextBounds(const TextSelection& selection) const {
    const int length = static_cast<int>(value_.text.size());
    return selection.start() <= length && selection.end() <= length;
}

void EditingController::insertInlineObject(std::u16string_view token) {
    const std::optional<char32_t> codePoint = text::singleReservedCodePoint(token);
    if (!codePoint) {
        throw std::invalid_argument("inline object token must be exactly one reserved code point");
    }

    const std::u16string& current = value_.text;
    const int length = static_cast<int>(current.size());
    int base = value_.selection.baseOffset;

    std::u16string next;
    next.reserve(current.size() + token.size());
    if (base != -1 && base < length) {
        next.append(current, 0, static_cast<std::size_t>(base));
        next.append(token);
        next.append(current, static_cast<std::size_t>(base), std::u16string::npos);
    } else {
        next = current;
        next.append(token);
        base = length;
    }

    EditingValue inserted;
    inserted.text = std::move(next);
    inserted.selection = TextSelection::collapsed(base + static_cast<int>(token.size()));
    inserted.composing = TextRange::empty();
    replace(std::move(inserted));
}

void EditingController::insertInlineObject(char32_t codePoint) {
    if (!text::isReserved(codePoint)) {
        throw std::invalid_argument("code point is outside the reserved inline-object range");
    }
    insertInlineObject(text::inlineObjectToken(codePoint));
}

// =============================================================================
// Formatting
// =============================================================================

void EditingController::addFormatter(std::shared_ptr<TextInputFormatter> formatter) {
    if (formatter) formatters_.push_back(std::move(formatter));
}

void EditingController::setDirectionalityNormalization(std::optional<TextDirection> baseDirection) {
    if (!baseDirection) {
        normalizer_.reset();
        return;
    }
    if (normalizer_ && normalizer_->baseDirection() == *baseDirection) {
        return;
    }
    normalizer_ = std::make_unique<DirectionalityNormalizer>(*baseDirection);
}

std::vector<text::Span> EditingController::buildSpans(
    const text::TextStyle& style,
    const text::InlineContentResolver& resolver,
    bool withComposing,
    const text::SpanBuildOptions& options
) const {
    const TextRange composing = withComposing && value_.isComposingRangeValid() ? value_.composing : TextRange::empty();
    return text::buildSpans(value_.text, style, resolver, composing, options);
}

} // namespace richedit::editing
