#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <vector>

#include "../types/Encoding.hpp"

/**
 * CharSource
 * ----------
 * Pull-style character input for the LineReader.
 *
 * Characters are Unicode code points. Implementations read the wrapped
 * std::istream in fixed-size chunks and throw IoFailure if the stream
 * goes bad mid-read.
 */
class CharSource {
public:
    virtual ~CharSource() = default;

    // Stores the next character in c. Returns false once input is exhausted.
    virtual bool next(char32_t& c) = 0;
};

/**
 * Chunked byte reader shared by both sources.
 */
class ByteBuffer {
public:
    explicit ByteBuffer(std::istream& in, std::size_t chunkSize = 8192);

    // Guarantees at least `wanted` unread bytes unless the stream ends first.
    // Returns the number of unread bytes available.
    std::size_t ensure(std::size_t wanted);

    const char* data() const { return buf.data() + offset; }
    void consume(std::size_t n) { offset += n; }

private:
    std::istream& in;
    std::vector<char> buf;
    std::size_t offset = 0;
    std::size_t limit = 0;
    std::size_t chunkSize;
    bool eof = false;

    bool fill();
};

// Byte stream: every byte is the code point of the same value (ISO 8859-1).
class Latin1Source : public CharSource {
public:
    explicit Latin1Source(std::istream& in);
    bool next(char32_t& c) override;

private:
    ByteBuffer bytes;
};

// Character stream: UTF-8 text, malformed sequences read as U+FFFD.
class Utf8Source : public CharSource {
public:
    explicit Utf8Source(std::istream& in);
    bool next(char32_t& c) override;

private:
    ByteBuffer bytes;
};

std::unique_ptr<CharSource> makeCharSource(std::istream& in, Encoding encoding);
