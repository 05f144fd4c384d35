#include "richedit/text/inline_object_codec.h"

#include "richedit/core/logging.h"
#include "richedit/core/string_utils.h"

namespace richedit::text {

InlineContent* decodeInlineObject(const InlineContentResolver& resolver, char32_t codePoint) {
    if (!isReserved(codePoint) || !resolver) {
        return nullptr;
    }
    InlineContent* content = resolver(codePoint);
    if (!content) {
        RICHEDIT_LOG_DEBUG("no inline content for U+%04X, rendering as text", static_cast<unsigned>(codePoint));
    }
    return content;
}

std::optional<char32_t> singleReservedCodePoint(std::u16string_view token) {
    std::uint32_t unitLen = 0;
    const char32_t cp = decodeUtf16At(token, 0, unitLen);
    if (unitLen == 0 || unitLen != token.size() || !isReserved(cp)) {
        return std::nullopt;
    }
    return cp;
}

std::u16string inlineObjectToken(char32_t codePoint) {
    std::u16string token;
    appendUtf16(token, codePoint);
    return token;
}

std::optional<char32_t> InlineObjectRegistry::registerObject(const std::string& tag, InlineContent* content) {
    auto existing = codePointByTag_.find(tag);
    if (existing != codePointByTag_.end()) {
        entries_[existing->second].content = content;
        return existing->second;
    }

    // Skip code points freed by unregisterObject() only once the range runs out.
    char32_t cp = nextCodePoint_;
    if (cp > kReservedEnd) {
        cp = kReservedStart;
        while (cp <= kReservedEnd && entries_.count(cp) != 0) {
            ++cp;
        }
        if (cp > kReservedEnd) {
            RICHEDIT_LOG_WARN("inline object range exhausted, cannot register '%s'", tag.c_str());
            return std::nullopt;
        }
    } else {
        ++nextCodePoint_;
    }

    codePointByTag_[tag] = cp;
    entries_[cp] = Entry{tag, content};
    return cp;
}

bool InlineObjectRegistry::unregisterObject(const std::string& tag) {
    auto it = codePointByTag_.find(tag);
    if (it == codePointByTag_.end()) {
        return false;
    }
    entries_.erase(it->second);
    codePointByTag_.erase(it);
    return true;
}

std::optional<char32_t> InlineObjectRegistry::encode(const std::string& tag) const {
    auto it = codePointByTag_.find(tag);
    if (it == codePointByTag_.end()) {
        return std::nullopt;
    }
    return it->second;
}

InlineContent* InlineObjectRegistry::decode(char32_t codePoint) const {
    auto it = entries_.find(codePoint);
    return (it != entries_.end()) ? it->second.content : nullptr;
}

std::optional<std::string> InlineObjectRegistry::tagFor(char32_t codePoint) const {
    auto it = entries_.find(codePoint);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.tag;
}

InlineContentResolver InlineObjectRegistry::resolver() const {
    return [this](char32_t codePoint) { return decode(codePoint); };
}

} // namespace richedit::text
