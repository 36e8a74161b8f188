#include "LineReader.hpp"

namespace {

bool isWhitespace(char32_t c) {
    return c == ' ' || c == '\t' || c == '\f';
}

bool isLineTerminator(char32_t c) {
    return c == '\n' || c == '\r';
}

} // namespace

LineReader::LineReader(CharSource& source)
    : source(source)
{
    lineBuf.reserve(1024);
}

bool LineReader::fetch(char32_t& c) {
    if (hasPending) {
        hasPending = false;
        c = pending;
        return true;
    }
    return source.next(c);
}

bool LineReader::hasMore() {
    if (hasPending)
        return true;
    hasPending = source.next(pending);
    return hasPending;
}

bool LineReader::readLine(std::u32string& line) {
    lineBuf.clear();

    char32_t c = 0;
    bool skipWhiteSpace = true;
    bool isCommentLine = false;
    bool isNewLine = true;
    bool appendedLineBegin = false;
    bool precedingBackslash = false;
    bool skipLF = false;

    while (true) {
        if (!fetch(c)) {
            if (lineBuf.empty() || isCommentLine)
                return false;
            line = lineBuf;
            return true;
        }

        // "\r\n" after a continuation: the '\n' belongs to the '\r'
        if (skipLF) {
            skipLF = false;
            if (c == '\n')
                continue;
        }

        if (skipWhiteSpace) {
            if (isWhitespace(c))
                continue;
            // Blank lines are skipped, but not the empty tail of a continuation
            if (!appendedLineBegin && isLineTerminator(c))
                continue;
            skipWhiteSpace = false;
            appendedLineBegin = false;
        }

        if (isNewLine) {
            isNewLine = false;
            if (c == '#' || c == '!') {
                isCommentLine = true;
                continue;
            }
        }

        if (!isLineTerminator(c)) {
            if (isCommentLine)
                continue;
            lineBuf.push_back(c);
            precedingBackslash = (c == '\\') ? !precedingBackslash : false;
            continue;
        }

        // Reached the end of a physical line.
        if (isCommentLine || lineBuf.empty()) {
            isCommentLine = false;
            isNewLine = true;
            skipWhiteSpace = true;
            precedingBackslash = false;
            lineBuf.clear();
            continue;
        }

        // Nothing follows: the line is complete, a trailing backslash stays.
        if (!hasMore()) {
            line = lineBuf;
            return true;
        }

        if (!precedingBackslash) {
            line = lineBuf;
            return true;
        }

        // Continuation: drop the backslash, then skip the next line's indent.
        lineBuf.pop_back();
        skipWhiteSpace = true;
        appendedLineBegin = true;
        precedingBackslash = false;
        if (c == '\r')
            skipLF = true;
    }
}
