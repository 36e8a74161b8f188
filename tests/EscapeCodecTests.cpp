#include <gtest/gtest.h>

#include <string>

#include "../src/format/EscapeCodec.hpp"
#include "../src/types/PropertiesError.hpp"
#include "../src/utils/utf8.hpp"

namespace {

std::string decode(const std::string& utf8) {
    EscapeCodec codec;
    std::u32string in = toCodePoints(utf8);
    return toUtf8(codec.loadConvert(in, 0, in.size()));
}

std::string encodeKey(const std::string& utf8, bool escapeUnicode = true) {
    return toUtf8(EscapeCodec::saveConvert(toCodePoints(utf8), true, escapeUnicode));
}

std::string encodeValue(const std::string& utf8, bool escapeUnicode = true) {
    return toUtf8(EscapeCodec::saveConvert(toCodePoints(utf8), false, escapeUnicode));
}

} // namespace

TEST(EscapeCodecTest, DecodesControlEscapes) {
    EXPECT_EQ("a\tb\nc\rd\fe", decode("a\\tb\\nc\\rd\\fe"));
}

TEST(EscapeCodecTest, BackslashEscapesAnyCharacter) {
    EXPECT_EQ("\\ =:#!x", decode("\\\\\\ \\=\\:\\#\\!\\x"));
}

TEST(EscapeCodecTest, DecodesUnicodeEscapesInEitherCase) {
    EXPECT_EQ("\xC3\xA9", decode("\\u00e9"));
    EXPECT_EQ("\xE2\x82\xAC", decode("\\u20AC"));
}

TEST(EscapeCodecTest, JoinsEscapedSurrogatePair) {
    EXPECT_EQ("\xF0\x9F\x98\x80", decode("\\uD83D\\uDE00"));
}

TEST(EscapeCodecTest, LoneSurrogateBecomesReplacementCharacter) {
    EXPECT_EQ("\xEF\xBF\xBD", decode("\\uD83D"));
}

TEST(EscapeCodecTest, TruncatedUnicodeEscapeIsMalformed) {
    EXPECT_THROW(decode("\\u12"), MalformedUnicodeEscape);
}

TEST(EscapeCodecTest, NonHexDigitIsMalformed) {
    EXPECT_THROW(decode("\\u12G4"), MalformedUnicodeEscape);
}

TEST(EscapeCodecTest, TrailingLoneBackslashIsLiteral) {
    EXPECT_EQ("foo\\", decode("foo\\"));
}

TEST(EscapeCodecTest, DecodesOnlyTheRequestedRange) {
    EscapeCodec codec;
    std::u32string line = U"key=va\\tl";
    EXPECT_EQ(U"key", codec.loadConvert(line, 0, 3));
    EXPECT_EQ(U"va\tl", codec.loadConvert(line, 4, line.size() - 4));
}

TEST(EscapeCodecTest, PlainPrintableAsciiIsUnchanged) {
    std::string plain = "abcXYZ019\"$%&'()*+,-./;<>?@[]^_`{|}~";
    EXPECT_EQ(plain, encodeValue(plain));
    EXPECT_EQ(plain, decode(plain));
}

TEST(EscapeCodecTest, EscapesStructuralCharacters) {
    EXPECT_EQ("a\\=b\\:c\\#d\\!e\\\\f", encodeKey("a=b:c#d!e\\f"));
    EXPECT_EQ("a\\=b\\:c\\#d\\!e\\\\f", encodeValue("a=b:c#d!e\\f"));
}

TEST(EscapeCodecTest, EscapesControlCharacters) {
    EXPECT_EQ("\\t\\n\\r\\f", encodeValue("\t\n\r\f"));
}

TEST(EscapeCodecTest, KeysEscapeEverySpace) {
    EXPECT_EQ("\\ a\\ b\\ ", encodeKey(" a b "));
}

TEST(EscapeCodecTest, ValuesEscapeOnlyTheLeadingSpace) {
    EXPECT_EQ("\\ a b ", encodeValue(" a b "));
    EXPECT_EQ("a b  ", encodeValue("a b  "));
}

TEST(EscapeCodecTest, UnicodeEscapingUsesUppercaseHex) {
    EXPECT_EQ("caf\\u00E9", encodeValue("caf\xC3\xA9"));
    EXPECT_EQ("\\u20AC", encodeValue("\xE2\x82\xAC"));
    EXPECT_EQ("\\u0001", encodeValue("\x01"));
}

TEST(EscapeCodecTest, SupplementaryCharactersBecomeSurrogatePairs) {
    EXPECT_EQ("\\uD83D\\uDE00", encodeValue("\xF0\x9F\x98\x80"));
}

TEST(EscapeCodecTest, WithoutUnicodeEscapingNonAsciiIsRaw) {
    EXPECT_EQ("caf\xC3\xA9", encodeValue("caf\xC3\xA9", false));
}

TEST(EscapeCodecTest, DecodeInvertsEncode) {
    const std::string samples[] = {
        "",
        " leading and trailing ",
        "tab\tnewline\ncr\rff\f",
        "c:\\path\\to\\file",
        "k=v:w#x!y",
        "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80",
    };

    for (const auto& s : samples) {
        EXPECT_EQ(s, decode(encodeKey(s))) << s;
        EXPECT_EQ(s, decode(encodeValue(s))) << s;
        EXPECT_EQ(s, decode(encodeValue(s, false))) << s;
    }
}
