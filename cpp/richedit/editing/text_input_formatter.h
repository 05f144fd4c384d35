#ifndef RICHEDIT_EDITING_TEXT_INPUT_FORMATTER_H
#define RICHEDIT_EDITING_TEXT_INPUT_FORMATTER_H

#include "richedit/editing/editing_value.h"

namespace richedit::editing {

/**
 * TextInputFormatter: rewrites a proposed value before it is committed.
 *
 * Formatters run in order whenever the text of the proposed value differs
 * from the current one. The returned value is validated afterwards.
 */
class TextInputFormatter {
public:
    virtual ~TextInputFormatter() = default;

    virtual EditingValue formatEditUpdate(const EditingValue& oldValue, const EditingValue& newValue) = 0;
};

} // namespace richedit::editing

#endif // RICHEDIT_EDITING_TEXT_INPUT_FORMATTER_H
