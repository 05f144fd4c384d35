#include "richedit/render/editable_config.h"

#include <stdexcept>

namespace richedit::render {

void validateEditableConfig(const EditableConfig& config) {
    if (config.maxLines && *config.maxLines <= 0) {
        throw std::invalid_argument("maxLines must be greater than 0");
    }
    if (config.minLines && *config.minLines <= 0) {
        throw std::invalid_argument("minLines must be greater than 0");
    }
    if (config.maxLines && config.minLines && *config.minLines > *config.maxLines) {
        throw std::invalid_argument("minLines can't be greater than maxLines");
    }
    if (config.expands && (config.maxLines || config.minLines)) {
        throw std::invalid_argument("minLines and maxLines must be unset when expands is set");
    }
    if (!(config.textScaleFactor > 0.0f)) {
        throw std::invalid_argument("textScaleFactor must be positive");
    }
    if (!(config.cursorWidth >= 0.0f)) {
        throw std::invalid_argument("cursorWidth must not be negative");
    }
    if (config.cursorHeight && !(*config.cursorHeight > 0.0f)) {
        throw std::invalid_argument("cursorHeight must be positive");
    }
    if (!(config.devicePixelRatio > 0.0f)) {
        throw std::invalid_argument("devicePixelRatio must be positive");
    }
}

} // namespace richedit::render
