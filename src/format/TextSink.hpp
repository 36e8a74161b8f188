#pragma once

#include <ostream>
#include <string>

#include "../types/Encoding.hpp"

// Line terminator written after every output line.
inline const std::u32string LINE_SEPARATOR = U"\n";

/**
 * TextSink
 * --------
 * Push-style character output used by the serializer. Sinks can be
 * stacked: a filter sink forwards to the sink it wraps.
 */
class TextSink {
public:
    virtual ~TextSink() = default;

    virtual void write(const std::u32string& text) = 0;
    virtual void flush() = 0;

    void newLine() { write(LINE_SEPARATOR); }
};

/**
 * Encodes characters onto a std::ostream.
 *   LATIN1 → one byte each; anything above U+00FF becomes '?'
 *   UTF8   → UTF-8 sequences
 * Throws IoFailure once the stream goes bad.
 */
class StreamSink : public TextSink {
public:
    StreamSink(std::ostream& out, Encoding encoding);

    void write(const std::u32string& text) override;
    void flush() override;

private:
    std::ostream& out;
    Encoding encoding;
    std::string bytes;

    void check();
};
