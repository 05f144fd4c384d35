#ifndef RICHEDIT_EDITING_CONTROLLER_H
#define RICHEDIT_EDITING_CONTROLLER_H

#include "richedit/core/types.h"
#include "richedit/editing/directionality_normalizer.h"
#include "richedit/editing/editing_value.h"
#include "richedit/editing/text_input_formatter.h"
#include "richedit/text/span_builder.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace richedit::editing {

/**
 * EditingController: sole owner of the EditingValue.
 *
 * Every change goes through replace(): caller formatters (only when the text
 * changed), then the directionality normalizer, then validation. Observers
 * are notified synchronously, once per committed change. A change requested
 * from inside an observer is queued and committed after the current round of
 * notifications finishes.
 */
class EditingController {
public:
    using Observer = std::function<void(const EditingValue&)>;
    using SubscriptionHandle = std::uint32_t;

    EditingController() = default;
    explicit EditingController(std::u16string text);

    EditingController(const EditingController&) = delete;
    EditingController& operator=(const EditingController&) = delete;

    const EditingValue& value() const { return value_; }
    const std::u16string& text() const { return value_.text; }
    const TextSelection& selection() const { return value_.selection; }
    TextRange composing() const { return value_.composing; }

    // =========================================================================
    // Observers
    // =========================================================================

    SubscriptionHandle subscribe(Observer observer);
    bool unsubscribe(SubscriptionHandle handle);
    std::size_t observerCount() const { return observers_.size(); }

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * Replace text, selection and composing at once.
     * @return ValidationError (previous value kept) when an offset lies outside
     *         [0, text.size()], Ok otherwise
     */
    EditError replace(EditingValue newValue);

    /**
     * Commit a value that already went through format(), skipping the
     * formatters.
     * @return ValidationError (previous value kept) when an offset is out of range
     */
    EditError commitFormatted(EditingValue formatted);

    /**
     * Replace the text. The selection becomes invalid and composing is cleared.
     */
    void setText(std::u16string text);

    EditError setSelection(TextSelection selection);

    void clear();
    void clearComposing();

    /**
     * Insert one inline-object code point at the selection base offset (or at
     * the end when there is no usable base). The selected text is not
     * replaced. The caret collapses after the inserted code point.
     * @throws std::invalid_argument unless `token` is exactly one reserved code point
     */
    void insertInlineObject(std::u16string_view token);
    void insertInlineObject(char32_t codePoint);

    bool isSelectionWithinTextBounds(const TextSelection& selection) const;

    // =========================================================================
    // Formatting
    // =========================================================================

    void addFormatter(std::shared_ptr<TextInputFormatter> formatter);
    void clearFormatters() { formatters_.clear(); }

    /**
     * Turn on directionality normalization for a paragraph direction. Passing
     * std::nullopt turns it off.
     */
    void setDirectionalityNormalization(std::optional<TextDirection> baseDirection);
    bool normalizesDirectionality() const { return normalizer_ != nullptr; }

    /**
     * Run formatters and normalizer on a proposed value without committing it.
     */
    EditingValue format(const EditingValue& proposed);

    // =========================================================================
    // Spans
    // =========================================================================

    /**
     * Spans for the current value. The composing range is underlined only
     * when `withComposing` is set and the range is valid.
     */
    std::vector<text::Span> buildSpans(
        const text::TextStyle& style,
        const text::InlineContentResolver& resolver,
        bool withComposing,
        const text::SpanBuildOptions& options = text::SpanBuildOptions{}
    ) const;

private:
    void commit(EditingValue value);
    void notifyObservers();

    EditingValue value_;

    struct Subscription {
        SubscriptionHandle handle;
        Observer observer;
    };
    std::vector<Subscription> observers_;
    SubscriptionHandle nextHandle_ = 1;

    std::vector<std::shared_ptr<TextInputFormatter>> formatters_;
    std::unique_ptr<DirectionalityNormalizer> normalizer_;

    bool notifying_ = false;
    std::deque<EditingValue> queued_;
};

} // namespace richedit::editing

#endif // RICHEDIT_EDITING_CONTROLLER_H
