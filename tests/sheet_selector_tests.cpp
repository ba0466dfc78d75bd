// tests/sheet_selector_tests.cpp
// -----------------------------------------------------------------------------
// Parsing of the sheet option into an index or a name.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "sheet_selector.hpp"

using xlsxconv::SheetSelector;
using xlsxconv::parse_sheet_selector;

TEST(SheetSelector, DefaultsToFirstSheet)
{
    const SheetSelector s;
    ASSERT_TRUE(s.is_index());
    EXPECT_EQ(s.as_index(), 0);
}

TEST(SheetSelector, IntegerTextIsIndex)
{
    const auto s = parse_sheet_selector("0");
    ASSERT_TRUE(s.is_index());
    EXPECT_EQ(s.as_index(), 0);

    const auto t = parse_sheet_selector(" 3 ");
    ASSERT_TRUE(t.is_index());
    EXPECT_EQ(t.as_index(), 3);

    EXPECT_EQ(parse_sheet_selector("+2"), SheetSelector::index(2));
    EXPECT_EQ(parse_sheet_selector("-1"), SheetSelector::index(-1));
}

TEST(SheetSelector, OtherTextIsName)
{
    const auto s = parse_sheet_selector("Sheet2");
    ASSERT_TRUE(s.is_name());
    EXPECT_EQ(s.as_name(), "Sheet2");

    // digits followed by text are still a name
    EXPECT_EQ(parse_sheet_selector("2024 Q1"), SheetSelector::name("2024 Q1"));
    EXPECT_EQ(parse_sheet_selector("+-3"), SheetSelector::name("+-3"));
    EXPECT_EQ(parse_sheet_selector("  Data  "), SheetSelector::name("Data"));
}

TEST(SheetSelector, EmptyTextIsIndexZero)
{
    EXPECT_EQ(parse_sheet_selector(""), SheetSelector::index(0));
    EXPECT_EQ(parse_sheet_selector("   "), SheetSelector::index(0));
}

TEST(SheetSelector, ToStringShowsIndexOrName)
{
    EXPECT_EQ(SheetSelector::index(4).to_string(), "4");
    EXPECT_EQ(SheetSelector::name("Summary").to_string(), "Summary");
}
