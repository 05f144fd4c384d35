#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace richedit {

// =============================================================================
// UTF-16 Code Units
// =============================================================================

inline bool isHighSurrogate(char16_t u) { return u >= 0xD800 && u <= 0xDBFF; }
inline bool isLowSurrogate(char16_t u) { return u >= 0xDC00 && u <= 0xDFFF; }
inline bool isSurrogate(char16_t u) { return u >= 0xD800 && u <= 0xDFFF; }

/**
 * Decode the code point starting at code unit `pos`.
 * Unpaired surrogates decode as themselves with unitLen 1.
 */
inline char32_t decodeUtf16At(std::u16string_view text, std::size_t pos, std::uint32_t& unitLen) {
    if (pos >= text.size()) {
        unitLen = 0;
        return 0;
    }
    const char16_t u0 = text[pos];
    if (isHighSurrogate(u0) && pos + 1 < text.size() && isLowSurrogate(text[pos + 1])) {
        unitLen = 2;
        return 0x10000 + ((static_cast<char32_t>(u0) - 0xD800) << 10) + (static_cast<char32_t>(text[pos + 1]) - 0xDC00);
    }
    unitLen = 1;
    return u0;
}

/**
 * Decode the code point that ends at code unit `pos` (exclusive).
 */
inline char32_t decodeUtf16Before(std::u16string_view text, std::size_t pos, std::uint32_t& unitLen) {
    if (pos == 0 || pos > text.size()) {
        unitLen = 0;
        return 0;
    }
    const char16_t u1 = text[pos - 1];
    if (isLowSurrogate(u1) && pos >= 2 && isHighSurrogate(text[pos - 2])) {
        unitLen = 2;
        return 0x10000 + ((static_cast<char32_t>(text[pos - 2]) - 0xD800) << 10) + (static_cast<char32_t>(u1) - 0xDC00);
    }
    unitLen = 1;
    return u1;
}

inline void appendUtf16(std::u16string& out, char32_t cp) {
    if (cp >= 0x10000 && cp <= 0x10FFFF) {
        const char32_t v = cp - 0x10000;
        out.push_back(static_cast<char16_t>(0xD800 + (v >> 10)));
        out.push_back(static_cast<char16_t>(0xDC00 + (v & 0x3FF)));
    } else {
        out.push_back(static_cast<char16_t>(cp));
    }
}

inline std::size_t utf16Length(char32_t cp) {
    return cp >= 0x10000 ? 2u : 1u;
}

// =============================================================================
// UTF-8 Conversion
// =============================================================================

inline char32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    auto cont = [&](std::size_t i) {
        return (static_cast<unsigned char>(content[pos + i]) & 0xC0) == 0x80;
    };

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n && cont(1)) {
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (content[pos + 1] & 0x3F);
    }
    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n && cont(1) && cont(2)) {
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((content[pos + 1] & 0x3F) << 6) | (content[pos + 2] & 0x3F);
    }
    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n && cont(1) && cont(2) && cont(3)) {
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((content[pos + 1] & 0x3F) << 12) |
               ((content[pos + 2] & 0x3F) << 6) | (content[pos + 3] & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

inline std::u16string utf8ToUtf16(std::string_view content) {
    std::u16string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t len = 0;
        const char32_t cp = decodeUtf8Codepoint(content, pos, len);
        if (len == 0) break;
        appendUtf16(out, cp);
        pos += len;
    }
    return out;
}

inline std::string utf16ToUtf8(std::u16string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t len = 0;
        const char32_t cp = decodeUtf16At(text, pos, len);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        pos += len;
    }
    return out;
}

// =============================================================================
// Character Classes
// =============================================================================

/**
 * Whitespace as matched by the ECMAScript `\s` class.
 */
inline bool isWhitespaceCodePoint(char32_t cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F:
        case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

inline bool isNewlineCodeUnit(char16_t u) {
    return u == u'\n';
}

} // namespace richedit
