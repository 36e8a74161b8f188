#include "DateSuppressingWriter.hpp"

#include <utility>

namespace {

bool endsWith(const std::u32string& s, const std::u32string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsComment(const std::u32string& s) {
    return !s.empty() && (s[0] == '#' || s[0] == '!');
}

} // namespace

DateSuppressingWriter::DateSuppressingWriter(TextSink& out)
    : out(out)
{
}

void DateSuppressingWriter::completeIfTerminated() {
    if (!endsWith(*current, LINE_SEPARATOR))
        return;

    if (previous)
        out.write(*previous);

    previous = std::move(*current);
    current.reset();
}

void DateSuppressingWriter::write(const std::u32string& text) {
    if (text.empty())
        return;

    if (current) {
        current->append(text);
        completeIfTerminated();
    } else if (startsComment(text)) {
        current = text;
        completeIfTerminated();
    } else {
        // Data follows: the held line was the timestamp.
        previous.reset();
        out.write(text);
    }
}

void DateSuppressingWriter::flush() {
    previous.reset();
    if (current) {
        out.write(*current);
        current.reset();
    }
    out.flush();
}
