#ifndef RICHEDIT_INTERACTION_INPUT_COLLABORATORS_H
#define RICHEDIT_INTERACTION_INPUT_COLLABORATORS_H

#include "richedit/core/types.h"
#include "richedit/editing/editing_value.h"
#include "richedit/text/text_types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Interfaces the host implements to connect an editable to the platform.

namespace richedit::interaction {

/**
 * Clipboard service. read() may answer later (after any number of edits)
 * or synchronously.
 */
class Clipboard {
public:
    using ReadCallback = std::function<void(std::optional<std::u16string>)>;

    virtual ~Clipboard() = default;

    virtual void write(std::u16string text) = 0;
    virtual void read(ReadCallback callback) = 0;
};

/**
 * Owner of the live editing value, used by copy/cut/paste/select-all and
 * delete. The value returned by textEditingValue() is always the current
 * one, not a snapshot.
 */
class TextSelectionDelegate {
public:
    virtual ~TextSelectionDelegate() = default;

    virtual const editing::EditingValue& textEditingValue() const = 0;
    virtual void setTextEditingValue(const editing::EditingValue& value) = 0;

    virtual bool copyEnabled() const { return true; }
    virtual bool cutEnabled() const { return true; }
    virtual bool pasteEnabled() const { return true; }
    virtual bool selectAllEnabled() const { return true; }
};

/**
 * Connection to the platform text input (IME). The IME calls back into
 * RichEditable::updateEditingValue / performAction / updateFloatingCursor.
 */
class TextInputConnection {
public:
    virtual ~TextInputConnection() = default;

    virtual bool attached() const = 0;
    virtual void setEditingState(const editing::EditingValue& value) = 0;
    virtual void setStyle(const text::TextStyle& style, TextDirection direction, TextAlign align) {
        (void)style;
        (void)direction;
        (void)align;
    }
    virtual void show() = 0;
    virtual void close() = 0;
};

/**
 * Opens input connections. open() is called on focus gain; the returned
 * connection is closed and released on focus loss.
 */
class TextInputService {
public:
    virtual ~TextInputService() = default;

    virtual std::unique_ptr<TextInputConnection> open() = 0;
};

} // namespace richedit::interaction

#endif // RICHEDIT_INTERACTION_INPUT_COLLABORATORS_H
