// tests/csv_writer_tests.cpp
// -----------------------------------------------------------------------------
// CSV rendering, quoting and output encodings.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "csv_writer.hpp"
#include "errors.hpp"
#include "text_encoder.hpp"
#include "test_helpers.hpp"

using xlsxconv::SheetTable;
using xlsxconv::TextEncoder;
using xlsxconv::csv_escape;
using xlsxconv::to_csv;
using xlsxconv::write_csv;

TEST(CsvWriter, QuotesOnlyWhenNeeded)
{
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape(""), "");
    EXPECT_EQ(csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csv_escape("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(csv_escape("cr\r"), "\"cr\r\"");
    EXPECT_EQ(csv_escape("semi;colon"), "semi;colon");
}

TEST(CsvWriter, HeaderThenRowsWithoutIndexColumn)
{
    SheetTable t;
    t.header = {"name", "qty", "note"};
    t.rows = {{"apple", "3", ""}, {"pear, green", "10", "ok"}};

    EXPECT_EQ(to_csv(t), "name,qty,note\napple,3,\n\"pear, green\",10,ok\n");
}

TEST(CsvWriter, HeaderOnlyTable)
{
    SheetTable t;
    t.header = {"a", "b"};
    EXPECT_EQ(to_csv(t), "a,b\n");
}

TEST(CsvWriter, WritesUtf8AndOverwrites)
{
    testutil::TempDir dir;
    const auto out = dir / "x.csv";
    testutil::touch(out, "old content that is longer than the new one\n");

    SheetTable t;
    t.header = {"city"};
    t.rows = {{"Zürich"}};
    write_csv(t, out, "utf-8");

    EXPECT_EQ(testutil::readFile(out), "city\nZ\xC3\xBCrich\n");
}

TEST(CsvWriter, Utf8SigPrefixesByteOrderMark)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"h"};
    write_csv(t, dir / "bom.csv", "UTF-8-SIG");

    EXPECT_EQ(testutil::readFile(dir / "bom.csv"), "\xEF\xBB\xBFh\n");
}

TEST(CsvWriter, ConvertsToLegacyEncoding)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"caf\xC3\xA9"};
    write_csv(t, dir / "latin.csv", "ISO-8859-1");

    EXPECT_EQ(testutil::readFile(dir / "latin.csv"), "caf\xE9\n");
}

TEST(CsvWriter, UnrepresentableCharacterFailsWithoutWriting)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"\xE6\x97\xA5"}; // CJK, not in Latin-1

    EXPECT_THROW(write_csv(t, dir / "bad.csv", "ISO-8859-1"), xlsxconv::EncodingError);
    EXPECT_FALSE(fs::exists(dir / "bad.csv"));
}

TEST(CsvWriter, UnknownEncodingFailsWithoutWriting)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"h"};

    EXPECT_THROW(write_csv(t, dir / "bad.csv", "no-such-encoding"), xlsxconv::EncodingError);
    EXPECT_FALSE(fs::exists(dir / "bad.csv"));
}

TEST(CsvWriter, MissingDirectoryIsAnError)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"h"};

    EXPECT_THROW(write_csv(t, dir / "missing/sub/out.csv", "utf-8"), std::runtime_error);
}

TEST(TextEncoder, Utf8NamesPassThrough)
{
    EXPECT_EQ(TextEncoder("utf-8").encode("\xC3\xA4"), "\xC3\xA4");
    EXPECT_EQ(TextEncoder("UTF8").encode("abc"), "abc");
    EXPECT_EQ(TextEncoder("Utf-8").name(), "Utf-8");
}

TEST(TextEncoder, LargeInputSurvivesBufferRefills)
{
    std::string big;
    for (int i = 0; i < 20000; ++i) big += "\xC3\xA9"; // 40000 bytes in, 20000 out
    const auto out = TextEncoder("ISO-8859-1").encode(big);
    ASSERT_EQ(out.size(), 20000u);
    EXPECT_EQ(out.front(), '\xE9');
    EXPECT_EQ(out.back(), '\xE9');
}

TEST(TextEncoder, AcceptsUnderscoreAndAliasSpellings)
{
    EXPECT_EQ(TextEncoder("utf_8").encode("ab"), "ab");
    EXPECT_EQ(TextEncoder("U8").encode("ab"), "ab");
    EXPECT_EQ(TextEncoder("utf_8_sig").encode("ab"), "\xEF\xBB\xBF" "ab");
    EXPECT_EQ(TextEncoder("latin-1").encode("Z\xC3\xBCrich"), "Z\xFCrich");
    EXPECT_EQ(TextEncoder("Latin_1").encode("\xC3\xA9"), "\xE9");
    EXPECT_EQ(TextEncoder("iso_8859_1").encode("\xC3\xA9"), "\xE9");
    EXPECT_EQ(TextEncoder("latin-1").name(), "latin-1");
}

TEST(CsvWriter, WritesWithPythonStyleEncodingNames)
{
    testutil::TempDir dir;
    SheetTable t;
    t.header = {"city"};
    t.rows = {{"Z\xC3\xBCrich"}};

    write_csv(t, dir / "sig.csv", "utf_8_sig");
    write_csv(t, dir / "latin.csv", "latin-1");

    EXPECT_EQ(testutil::readFile(dir / "sig.csv"), "\xEF\xBB\xBF" "city\nZ\xC3\xBCrich\n");
    EXPECT_EQ(testutil::readFile(dir / "latin.csv"), "city\nZ\xFCrich\n");
}
