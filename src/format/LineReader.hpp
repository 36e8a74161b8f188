#pragma once

#include <string>

#include "CharSource.hpp"

/*
------------------------------------------------------------------------------
  LOGICAL LINES
------------------------------------------------------------------------------

A properties file is read one *logical* line at a time. A logical line is
one key/value declaration and may span several physical lines:

    # comment lines start with '#' or '!'
    fruits = apple, banana, \
             cherry

yields the single logical line "fruits = apple, banana, cherry".

Rules applied while reading:
  • leading space / tab / form-feed of every physical line is dropped
  • blank lines and comment lines are skipped
  • '\n', '\r' and "\r\n" all terminate a physical line
  • an odd number of backslashes right before the terminator joins the
    next physical line (the last backslash is dropped); an even number is
    plain escaped backslashes and ends the line
  • a '#' or '!' at the start of a *continued* line is data
  • the last line may end without a terminator
------------------------------------------------------------------------------
*/
class LineReader {
public:
    explicit LineReader(CharSource& source);

    // Reads the next logical line into `line` (escapes still encoded).
    // Returns false when the input holds no further logical line.
    bool readLine(std::u32string& line);

private:
    CharSource& source;

    // Growable scratch buffer for the line being assembled.
    std::u32string lineBuf;

    // One character of lookahead, needed to tell "terminator then EOF"
    // apart from "terminator then more input".
    bool hasPending = false;
    char32_t pending = 0;

    bool fetch(char32_t& c);
    bool hasMore();
};
