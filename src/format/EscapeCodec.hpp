#pragma once

#include <cstddef>
#include <string>

/**
 * EscapeCodec
 * -----------
 * Backslash escaping of keys, values and comments in the properties format.
 *
 * Decoding ("load"):
 *   \t \n \r \f → control character
 *   \uXXXX      → UTF-16 code unit (a surrogate pair joins into one code point)
 *   \<any>      → <any>   (covers \\ \  \= \: \# \! and everything else)
 *
 * Encoding ("save"):
 *   \ → \\        tab/LF/CR/FF → \t \n \r \f
 *   = : # !       → always escaped
 *   space         → escaped in keys; in values only when leading
 *   non-ASCII     → \uXXXX when unicode escaping is requested
 *
 * One codec instance is used per load call; its decode buffer is reused
 * across the lines of that call only.
 */
class EscapeCodec {
public:
    /**
     * Decodes in[off, off + len).
     * Throws MalformedUnicodeEscape on a bad or truncated \uXXXX.
     * A lone backslash at the very end decodes to a literal backslash.
     */
    std::u32string loadConvert(const std::u32string& in, std::size_t off, std::size_t len);

    static std::u32string saveConvert(const std::u32string& text,
                                      bool escapeSpace,
                                      bool escapeUnicode);

    // Appends "\uXXXX" (uppercase hex) for one UTF-16 code unit.
    static void appendUnicodeEscape(std::u32string& out, char32_t unit);

    static char32_t toHex(int nibble);

private:
    std::u32string convtBuf;
};
