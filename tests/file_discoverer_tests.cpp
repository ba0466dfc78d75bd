// tests/file_discoverer_tests.cpp
// -----------------------------------------------------------------------------
// Recursive workbook discovery and the single-file fast path.
//   * Discovery only looks at names, so plain files stand in for workbooks.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "file_discoverer.hpp"
#include "test_helpers.hpp"

using xlsxconv::discover_workbooks;
using xlsxconv::has_workbook_extension;

static std::set<std::string> relativeTo(const fs::path& root, const std::vector<fs::path>& paths)
{
    std::set<std::string> out;
    for (const auto& p : paths) out.insert(fs::relative(p, root).generic_string());
    return out;
}

TEST(FileDiscoverer, ExtensionMatchIgnoresCase)
{
    EXPECT_TRUE(has_workbook_extension("a.xlsx"));
    EXPECT_TRUE(has_workbook_extension("dir/B.XLSX"));
    EXPECT_TRUE(has_workbook_extension("c.XlSx"));
    EXPECT_FALSE(has_workbook_extension("c.txt"));
    EXPECT_FALSE(has_workbook_extension("d.xls"));
    EXPECT_FALSE(has_workbook_extension("e.xlsx.bak"));
}

TEST(FileDiscoverer, WalksRecursivelyAndFiltersByExtension)
{
    testutil::TempDir dir;
    testutil::touch(dir / "a.xlsx");
    testutil::touch(dir / "B.XLSX");
    testutil::touch(dir / "c.txt");
    testutil::touch(dir / "sub/d.xlsx");

    const auto found = discover_workbooks(dir.path());

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(relativeTo(dir.path(), found),
              (std::set<std::string>{"a.xlsx", "B.XLSX", "sub/d.xlsx"}));
    for (const auto& p : found) {
        // entries are rooted at the walked directory
        EXPECT_EQ(std::mismatch(dir.path().begin(), dir.path().end(), p.begin()).first, dir.path().end());
    }
}

TEST(FileDiscoverer, DirectoryNamedLikeWorkbookIsDescendedNotListed)
{
    testutil::TempDir dir;
    fs::create_directories(dir / "archive.xlsx");
    testutil::touch(dir / "archive.xlsx/inner.xlsx");

    const auto found = discover_workbooks(dir.path());
    EXPECT_EQ(relativeTo(dir.path(), found), (std::set<std::string>{"archive.xlsx/inner.xlsx"}));
}

TEST(FileDiscoverer, SingleWorkbookFileIsReturnedAbsolute)
{
    testutil::TempDir dir;
    testutil::touch(dir / "report.xlsx");

    const auto found = discover_workbooks(dir / "report.xlsx");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_TRUE(found.front().is_absolute());
    EXPECT_EQ(found.front().filename(), "report.xlsx");
}

TEST(FileDiscoverer, SingleNonWorkbookFileGivesEmptySet)
{
    testutil::TempDir dir;
    testutil::touch(dir / "report.txt");

    EXPECT_TRUE(discover_workbooks(dir / "report.txt").empty());
}

TEST(FileDiscoverer, MissingPathGivesEmptySetWithoutThrowing)
{
    std::vector<fs::path> found;
    EXPECT_NO_THROW(found = discover_workbooks("/does/not/exist"));
    EXPECT_TRUE(found.empty());
}

TEST(FileDiscoverer, EmptyDirectoryGivesEmptySet)
{
    testutil::TempDir dir;
    EXPECT_TRUE(discover_workbooks(dir.path()).empty());
}
