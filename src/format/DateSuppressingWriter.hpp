#pragma once

#include <optional>
#include <string>

#include "TextSink.hpp"

/*
------------------------------------------------------------------------------
  DATE-SUPPRESSING FILTER
------------------------------------------------------------------------------

The serializer always emits the header as

    #<comment line 1>        ┐ optional caller comment
    #<comment line n>        ┘
    #<timestamp>
    key=value ...

This filter sits between the serializer and the real sink and drops the
*last* comment line before the data, i.e. the timestamp, so that stored
files are reproducible.

It keeps two slots:
    current  → comment line still being written (no terminator seen yet)
    previous → last completed comment line, held back

  • a write starting a line with '#' or '!' opens `current`
  • when `current` is terminated, the held `previous` is released and
    `current` becomes the new `previous`
  • a non-comment write proves `previous` was the final comment line:
    it is discarded and the write passes through
  • flush() discards `previous` too (a store with no entries)
------------------------------------------------------------------------------
*/
class DateSuppressingWriter : public TextSink {
public:
    explicit DateSuppressingWriter(TextSink& out);

    void write(const std::u32string& text) override;
    void flush() override;

private:
    TextSink& out;
    std::optional<std::u32string> current;
    std::optional<std::u32string> previous;

    void completeIfTerminated();
};
