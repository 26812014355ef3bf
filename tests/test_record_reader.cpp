#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/RecordReader.h"
#include "core/Errors.h"
#include <string>

namespace revkit {

TEST(RecordReaderTest, HeaderAndRecords) {
    RecordReader reader({"id", "goal"});
    auto doc = reader.parse(
        "# comment\n"
        "version=1\n"
        "\n"
        "id=a\n"
        "title = First module \n"
        "tags=x\n"
        "tags=y\n"
        "goal=g\n"
        "modules=a\n", "mem");

    EXPECT_EQ(doc.source, "mem");
    ASSERT_EQ(doc.header.size(), 1u);
    EXPECT_EQ(doc.header_get("version")->value, "1");
    ASSERT_EQ(doc.records.size(), 2u);

    const Record& a = doc.records[0];
    EXPECT_EQ(a.kind, "id");
    EXPECT_EQ(a.name, "a");
    EXPECT_EQ(a.line, 4u);
    EXPECT_EQ(a.get("title")->value, "First module");
    EXPECT_EQ(a.get("tags")->value, "y"); // last occurrence
    EXPECT_THAT(a.get_all("tags"), ::testing::ElementsAre("x", "y"));
    EXPECT_EQ(a.get("missing"), nullptr);

    EXPECT_EQ(doc.records[1].kind, "goal");
    EXPECT_EQ(doc.records[1].get("modules")->line, 9u);
}

TEST(RecordReaderTest, ValueMayContainEquals) {
    RecordReader reader({"module"});
    auto doc = reader.parse("module=a\ndescription=x = y\n", "mem");
    EXPECT_EQ(doc.records[0].get("description")->value, "x = y");
}

TEST(RecordReaderTest, MissingEqualsIsFormatError) {
    RecordReader reader({"id"});
    try {
        reader.parse("id=a\njunk line\n", "m.txt");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.file(), "m.txt");
        EXPECT_EQ(e.line(), 2u);
    }
}

TEST(RecordReaderTest, EmptyLeaderValueRejected) {
    RecordReader reader({"id"});
    EXPECT_THROW(reader.parse("id=\n", "mem"), FormatError);
    EXPECT_THROW(reader.parse("=value\n", "mem"), FormatError);
}

TEST(RecordReaderTest, NullBytesAndLongLinesRejected) {
    RecordReader reader({"id"});
    EXPECT_THROW(reader.parse(std::string("id=a\0b\n", 7), "mem"), FormatError);
    EXPECT_THROW(reader.parse("id=" + std::string(RecordReader::kMaxLineLength + 1, 'x'), "mem"), FormatError);
}

TEST(RecordReaderTest, UnreadableFile) {
    RecordReader reader({"id"});
    EXPECT_THROW(reader.parse_file("/non/existent/manifest"), Error);
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
