#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Substituted for malformed input and for code points UTF-8 cannot carry.
constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

inline bool isHighSurrogate(char32_t c) {
    return c >= 0xD800 && c <= 0xDBFF;
}

inline bool isLowSurrogate(char32_t c) {
    return c >= 0xDC00 && c <= 0xDFFF;
}

inline char32_t combineSurrogates(char32_t high, char32_t low) {
    return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

inline void appendUtf8(std::string& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = REPLACEMENT_CHARACTER;

    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/**
 * Decodes one code point starting at data[i].
 *
 * On success advances i past the sequence and returns true.
 * On a malformed, overlong, surrogate or truncated sequence advances i by
 * one byte, sets cp to U+FFFD and returns false.
 */
inline bool decodeUtf8At(const char* data, std::size_t len, std::size_t& i, char32_t& cp) {
    const auto c = static_cast<std::uint8_t>(data[i]);
    if ((c & 0x80u) == 0) {
        cp = c;
        i += 1;
        return true;
    }

    std::size_t remaining = 0;
    char32_t value = 0;
    char32_t minimum = 0;
    if ((c & 0xE0u) == 0xC0u) { value = c & 0x1Fu; remaining = 1; minimum = 0x80; }
    else if ((c & 0xF0u) == 0xE0u) { value = c & 0x0Fu; remaining = 2; minimum = 0x800; }
    else if ((c & 0xF8u) == 0xF0u) { value = c & 0x07u; remaining = 3; minimum = 0x10000; }
    else {
        cp = REPLACEMENT_CHARACTER;
        i += 1;
        return false;
    }

    if (i + remaining >= len) {
        cp = REPLACEMENT_CHARACTER;
        i += 1;
        return false;
    }

    for (std::size_t j = 0; j < remaining; ++j) {
        const auto cc = static_cast<std::uint8_t>(data[i + 1 + j]);
        if ((cc & 0xC0u) != 0x80u) {
            cp = REPLACEMENT_CHARACTER;
            i += 1;
            return false;
        }
        value = (value << 6) | (cc & 0x3Fu);
    }

    if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        cp = REPLACEMENT_CHARACTER;
        i += 1;
        return false;
    }

    i += 1 + remaining;
    cp = value;
    return true;
}

inline std::u32string toCodePoints(const std::string& utf8) {
    std::u32string out;
    out.reserve(utf8.size());
    std::size_t i = 0;
    while (i < utf8.size()) {
        char32_t cp = 0;
        decodeUtf8At(utf8.data(), utf8.size(), i, cp);
        out.push_back(cp);
    }
    return out;
}

inline std::string toUtf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text)
        appendUtf8(out, cp);
    return out;
}
