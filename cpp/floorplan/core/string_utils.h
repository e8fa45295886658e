#pragma once

#include <cstdint>
#include <string_view>

namespace floorplan {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

// Decodes the code point starting at `pos`. Malformed sequences yield U+FFFD
// with byteLen 1; `pos` past the end yields 0 with byteLen 0.
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
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

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

inline bool isAsciiDigit(std::uint32_t cp) { return cp >= '0' && cp <= '9'; }

inline bool isAsciiSpace(std::uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r';
}

} // namespace floorplan
