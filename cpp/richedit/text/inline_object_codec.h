#ifndef RICHEDIT_TEXT_INLINE_OBJECT_CODEC_H
#define RICHEDIT_TEXT_INLINE_OBJECT_CODEC_H

#include "richedit/text/inline_content.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace richedit::text {

// Private-use range reserved for inline objects. One code point = one object.
constexpr char32_t kReservedStart = 0xE000;
constexpr char32_t kReservedEnd = 0xF8FF;

inline bool isReserved(char32_t codePoint) {
    return codePoint >= kReservedStart && codePoint <= kReservedEnd;
}

// Caller-supplied mapping; nullptr means "no mapping".
using InlineContentResolver = std::function<InlineContent*(char32_t)>;

/**
 * Resolve a code point to inline content.
 * @return nullptr if the code point is not reserved, the resolver is empty, or
 *         the resolver does not recognize it. The caller then renders it as text.
 */
InlineContent* decodeInlineObject(const InlineContentResolver& resolver, char32_t codePoint);

/**
 * Extract the inline-object code point from a token.
 * @return The code point iff `token` is exactly one reserved code point
 */
std::optional<char32_t> singleReservedCodePoint(std::u16string_view token);

/**
 * Encode a code point as its one-unit UTF-16 token.
 */
std::u16string inlineObjectToken(char32_t codePoint);

/**
 * InlineObjectRegistry: a ready-made caller-side codec.
 *
 * Hands out consecutive reserved code points to string tags ("smile",
 * "img:42", ...) and resolves them back to the registered content. The
 * registry does not own the content.
 */
class InlineObjectRegistry {
public:
    InlineObjectRegistry() = default;

    /**
     * Register (or re-point) a tag.
     * @return The tag's code point, or std::nullopt when the reserved range is exhausted
     */
    std::optional<char32_t> registerObject(const std::string& tag, InlineContent* content);

    bool unregisterObject(const std::string& tag);

    std::optional<char32_t> encode(const std::string& tag) const;
    InlineContent* decode(char32_t codePoint) const;
    std::optional<std::string> tagFor(char32_t codePoint) const;

    /**
     * Resolver bound to this registry. The registry must outlive it.
     */
    InlineContentResolver resolver() const;

    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string tag;
        InlineContent* content;
    };

    std::unordered_map<std::string, char32_t> codePointByTag_;
    std::unordered_map<char32_t, Entry> entries_;
    char32_t nextCodePoint_ = kReservedStart;
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_INLINE_OBJECT_CODEC_H
