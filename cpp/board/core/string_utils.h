#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace board {

// =============================================================================
// UTF-8 helpers
// =============================================================================

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

/**
 * Truncate to at most `maxCodepoints` code points without splitting a
 * multi-byte sequence.
 */
inline std::string truncateUtf8(std::string_view content, std::size_t maxCodepoints) {
    std::size_t bytePos = 0;
    std::size_t count = 0;
    const std::size_t n = content.size();
    while (bytePos < n && count < maxCodepoints) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        bytePos += byteLen;
        ++count;
    }
    return std::string(content.substr(0, bytePos));
}

inline std::string toLowerAscii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

inline std::string trimAscii(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) --e;
    return std::string(s.substr(b, e - b));
}

} // namespace board
