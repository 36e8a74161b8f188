#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../src/format/DateSuppressingWriter.hpp"
#include "../src/format/PropertiesWriter.hpp"
#include "../src/format/TextSink.hpp"
#include "../src/store/OrderedProperties.hpp"
#include "../src/store/PropertiesAdapter.hpp"
#include "../src/types/PropertiesError.hpp"
#include "../src/utils/time.hpp"
#include "../src/utils/utf8.hpp"
#include "TestHelpers.hpp"

namespace {

// Collects every write() call separately.
class RecordingSink : public TextSink {
public:
    std::vector<std::string> writes;
    int flushes = 0;

    void write(const std::u32string& text) override { writes.push_back(toUtf8(text)); }
    void flush() override { flushes++; }

    std::string joined() const {
        std::string out;
        for (const auto& w : writes)
            out += w;
        return out;
    }
};

OrderedProperties suppressing() {
    return OrderedPropertiesBuilder().withSuppressDateInComment(true).build();
}

std::string commentsOf(const std::string& text) {
    RecordingSink sink;
    PropertiesWriter::writeComments(sink, toCodePoints(text));
    return sink.joined();
}

} // namespace

// ----------------------------------------------------
// Comment block
// ----------------------------------------------------
TEST(PropertiesWriterTest, SingleLineComment) {
    EXPECT_EQ("#hdr\n", commentsOf("hdr"));
}

TEST(PropertiesWriterTest, EachCommentLineGetsAHash) {
    EXPECT_EQ("#one\n#two\n#three\n", commentsOf("one\ntwo\r\nthree"));
    EXPECT_EQ("#one\n#two\n", commentsOf("one\rtwo"));
}

TEST(PropertiesWriterTest, ExistingCommentMarkerIsNotDoubled) {
    EXPECT_EQ("#one\n#two\n!three\n", commentsOf("one\n#two\n!three"));
}

TEST(PropertiesWriterTest, TrailingNewlineInCommentAddsEmptyCommentLine) {
    EXPECT_EQ("#hdr\n#\n", commentsOf("hdr\n"));
}

TEST(PropertiesWriterTest, CommentEscapesOnlyAboveLatin1) {
    EXPECT_EQ("#caf\xC3\xA9 \\u20AC\n", commentsOf("caf\xC3\xA9 \xE2\x82\xAC"));
}

// ----------------------------------------------------
// Full store
// ----------------------------------------------------
TEST(PropertiesWriterTest, WritesCommentDateAndEntriesInOrder) {
    OrderedProperties props;
    props.set("b", "2");
    props.set("a", "1");

    RecordingSink sink;
    PropertiesAdapter source(props);
    PropertiesWriter::store(source, sink, std::string("hdr"), true, "Sun Oct 18 14:03:22 UTC 2026");

    EXPECT_EQ("#hdr\n#Sun Oct 18 14:03:22 UTC 2026\nb=2\na=1\n", sink.joined());
    EXPECT_EQ(1, sink.flushes);
}

TEST(PropertiesWriterTest, StoreWithoutSuppressionHasDateLine) {
    OrderedProperties props;
    props.set("k", "v");

    auto lines = splitLines(storeToString(props, std::string("hdr")));

    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ("#hdr", lines[0]);
    ASSERT_FALSE(lines[1].empty());
    EXPECT_EQ('#', lines[1][0]);
    EXPECT_GT(lines[1].size(), 20u);
    EXPECT_EQ("k=v", lines[2]);
}

TEST(PropertiesWriterTest, StoreWithoutCommentStillHasDateLine) {
    OrderedProperties props;
    props.set("k", "v");

    auto lines = splitLines(storeToString(props, std::nullopt));
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ('#', lines[0][0]);
    EXPECT_EQ("k=v", lines[1]);
}

TEST(PropertiesWriterTest, SuppressedDateProducesExactOutput) {
    auto props = suppressing();
    props.set("k", "v");

    EXPECT_EQ("#hdr\nk=v\n", storeToString(props, std::string("hdr")));
}

TEST(PropertiesWriterTest, SuppressedDateWithoutComment) {
    auto props = suppressing();
    props.set("k", "v");

    EXPECT_EQ("k=v\n", storeToString(props, std::nullopt));
}

TEST(PropertiesWriterTest, SuppressedDateKeepsMultiLineComment) {
    auto props = suppressing();
    props.set("k", "v");

    EXPECT_EQ("#one\n#two\n!three\nk=v\n", storeToString(props, std::string("one\ntwo\n!three")));
}

TEST(PropertiesWriterTest, SuppressedDateOnEmptyStore) {
    auto props = suppressing();

    EXPECT_EQ("#hdr\n", storeToString(props, std::string("hdr")));
    EXPECT_EQ("", storeToString(props, std::nullopt));
}

TEST(PropertiesWriterTest, EscapesKeysAndValues) {
    auto props = suppressing();
    props.set("my key", " leading, trailing ");
    props.set("a=b", "x:y#z!");

    EXPECT_EQ("my\\ key=\\ leading, trailing \n"
              "a\\=b=x\\:y\\#z\\!\n",
              storeToString(props, std::nullopt));
}

TEST(PropertiesWriterTest, Latin1StoreEscapesNonAscii) {
    auto props = suppressing();
    props.set("name", "Jos\xC3\xA9 \xE2\x82\xAC");

    EXPECT_EQ("name=Jos\\u00E9 \\u20AC\n", storeToString(props, std::nullopt, Encoding::LATIN1));
}

TEST(PropertiesWriterTest, Utf8StoreWritesNonAsciiRaw) {
    auto props = suppressing();
    props.set("name", "Jos\xC3\xA9 \xE2\x82\xAC");

    EXPECT_EQ("name=Jos\xC3\xA9 \xE2\x82\xAC\n", storeToString(props, std::nullopt, Encoding::UTF8));
}

TEST(PropertiesWriterTest, Latin1CommentKeepsLatin1Bytes) {
    auto props = suppressing();

    EXPECT_EQ(std::string("#caf\xE9\n"), storeToString(props, std::string("caf\xC3\xA9")));
}

TEST(PropertiesWriterTest, ComparatorOrderDrivesOutput) {
    auto props = OrderedPropertiesBuilder()
                     .withOrdering([](const std::string& a, const std::string& b) { return a > b; })
                     .withSuppressDateInComment(true)
                     .build();
    props.set("a", "1");
    props.set("c", "3");
    props.set("b", "2");

    EXPECT_EQ("c=3\nb=2\na=1\n", storeToString(props, std::nullopt));
}

TEST(PropertiesWriterTest, RoundTripPreservesOrderedEntries) {
    OrderedProperties props;
    props.set("z last", " spaced value ");
    props.set("path", "c:\\dir\\file");
    props.set("multi", "line1\nline2\r\n");
    props.set("", "empty key");
    props.set("empty", "");
    props.set("symbols", "=:#!");
    props.set("unicode", "caf\xC3\xA9 \xF0\x9F\x98\x80");

    for (Encoding enc : {Encoding::LATIN1, Encoding::UTF8}) {
        std::string text = storeToString(props, std::string("round\ntrip"), enc);
        EXPECT_EQ(props, loadFrom(text, enc)) << text;
    }
}

TEST(PropertiesWriterTest, BadStreamIsAnIoFailure) {
    OrderedProperties props;
    props.set("k", "v");
    std::ostringstream out;
    out.setstate(std::ios::badbit);

    EXPECT_THROW(props.store(out, std::nullopt), IoFailure);
}

TEST(PropertiesWriterTest, DateCommentLayout) {
    std::string date = currentDateComment();

    // "Www Mmm dd hh:mm:ss ZZZ yyyy"
    ASSERT_GE(date.size(), 24u);
    EXPECT_EQ(' ', date[3]);
    EXPECT_EQ(' ', date[7]);
    EXPECT_EQ(' ', date[10]);
    EXPECT_EQ(':', date[13]);
    EXPECT_EQ(':', date[16]);
}

// ----------------------------------------------------
// Date-suppressing filter in isolation
// ----------------------------------------------------
TEST(DateSuppressingWriterTest, DropsOnlyTheLastCommentBeforeData) {
    RecordingSink out;
    DateSuppressingWriter filter(out);

    filter.write(U"#");
    filter.write(U"first");
    filter.newLine();
    filter.write(U"#second");
    filter.newLine();
    filter.write(U"#date");
    filter.newLine();
    filter.write(U"k=v");
    filter.newLine();
    filter.flush();

    EXPECT_EQ("#first\n#second\nk=v\n", out.joined());
    EXPECT_EQ(1, out.flushes);
}

TEST(DateSuppressingWriterTest, DropsHeldCommentOnFlush) {
    RecordingSink out;
    DateSuppressingWriter filter(out);

    filter.write(U"#only\n");
    filter.flush();

    EXPECT_EQ("", out.joined());
}

TEST(DateSuppressingWriterTest, PassesDataThroughUntouched) {
    RecordingSink out;
    DateSuppressingWriter filter(out);

    filter.write(U"a=1");
    filter.newLine();
    filter.write(U"b=2\n");
    filter.flush();

    EXPECT_EQ("a=1\nb=2\n", out.joined());
}
