#include "PropertiesParser.hpp"

#include "EscapeCodec.hpp"
#include "../utils/utf8.hpp"

namespace {

bool isWhitespace(char32_t c) {
    return c == ' ' || c == '\t' || c == '\f';
}

bool isSeparator(char32_t c) {
    return c == '=' || c == ':';
}

} // namespace

KeyValueSplit PropertiesParser::splitLine(const std::u32string& line) {
    std::size_t limit = line.size();
    std::size_t keyLen = 0;
    std::size_t valueStart = limit;
    bool hasSep = false;
    bool precedingBackslash = false;

    while (keyLen < limit) {
        char32_t c = line[keyLen];
        if (isSeparator(c) && !precedingBackslash) {
            valueStart = keyLen + 1;
            hasSep = true;
            break;
        }
        if (isWhitespace(c) && !precedingBackslash) {
            valueStart = keyLen + 1;
            break;
        }
        precedingBackslash = (c == '\\') ? !precedingBackslash : false;
        keyLen++;
    }

    while (valueStart < limit) {
        char32_t c = line[valueStart];
        if (!isWhitespace(c)) {
            if (!hasSep && isSeparator(c))
                hasSep = true;
            else
                break;
        }
        valueStart++;
    }

    return KeyValueSplit{keyLen, valueStart};
}

void PropertiesParser::load(LineReader& reader, PropertyMap& target) {
    EscapeCodec codec;
    std::u32string line;

    while (reader.readLine(line)) {
        KeyValueSplit split = splitLine(line);

        std::string key = toUtf8(codec.loadConvert(line, 0, split.keyLen));
        std::string value = toUtf8(codec.loadConvert(line, split.valueStart,
                                                     line.size() - split.valueStart));
        target.put(key, value);
    }
}
