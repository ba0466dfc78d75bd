// tests/cli_tests.cpp
// -----------------------------------------------------------------------------
// Command-line host: option parsing and the exported run report.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <CLI/CLI.hpp>

#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "test_helpers.hpp"

namespace {

Settings parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "xlsxconv");
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    app.parse(static_cast<int>(args.size()), args.data());
    return settings;
}

} // namespace

TEST(CliParser, AppliesDefaults)
{
    const auto s = parse({"in.xlsx", "-o", "out"});
    EXPECT_EQ(s.input, "in.xlsx");
    EXPECT_EQ(s.output_dir, "out");
    EXPECT_EQ(s.sheet, "0");
    EXPECT_EQ(s.encoding, "utf-8");
    EXPECT_FALSE(s.quiet);
    EXPECT_TRUE(s.report_path.empty());
}

TEST(CliParser, ReadsEveryOption)
{
    const auto s = parse({"data", "--output", "csv", "-s", "Summary", "-e", "cp949",
                          "--log-level", "info", "--report", "run.csv", "-q"});
    EXPECT_EQ(s.sheet, "Summary");
    EXPECT_EQ(s.encoding, "cp949");
    EXPECT_EQ(s.report_path, fs::path("run.csv"));
    EXPECT_TRUE(s.quiet);
    EXPECT_TRUE(Logger::string_to_level(s.log_level).has_value());
}

TEST(CliParser, TrimsValuesAndDefaultsBlankEncoding)
{
    const auto s = parse({"  data  ", "-o", " out ", "-e", "  "});
    EXPECT_EQ(s.input, "data");
    EXPECT_EQ(s.output_dir, "out");
    EXPECT_EQ(s.encoding, "utf-8");
}

TEST(CliParser, RejectsBlankInputOrOutput)
{
    EXPECT_THROW(parse({"   ", "-o", "out"}), CLI::ValidationError);
    EXPECT_THROW(parse({"in", "-o", "  "}), CLI::ValidationError);
    EXPECT_THROW(parse({"in"}), CLI::RequiredError);
}

TEST(CliParser, RejectsUnknownLogLevel)
{
    EXPECT_THROW(parse({"in", "-o", "out", "--log-level", "LOUD"}), CLI::ValidationError);
}

TEST(RunReport, ExportsOneLinePerFileAndTotals)
{
    testutil::TempDir dir;
    xlsxconv::ConversionSummary summary;
    summary.status = xlsxconv::RunStatus::Completed;

    xlsxconv::FileResult ok;
    ok.source = "/in/a.xlsx";
    ok.status = xlsxconv::FileStatus::Converted;
    ok.output = "/out/a.csv";
    ok.rows = 12;
    summary.files.push_back(ok);

    xlsxconv::FileResult bad;
    bad.source = "/in/b.xlsx";
    bad.error = "worksheet named 'X' not found, really";
    summary.files.push_back(bad);

    const auto path = dir / "report.csv";
    ASSERT_TRUE(export_csv_report(summary, path));

    const auto lines = testutil::readLines(path);
    ASSERT_GE(lines.size(), 7u);
    EXPECT_EQ(lines[0], "File,Status,Rows,Output,Error");
    EXPECT_EQ(lines[1], "/in/a.xlsx,converted,12,/out/a.csv,");
    EXPECT_EQ(lines[2], "/in/b.xlsx,failed,,,\"worksheet named 'X' not found, really\"");
    EXPECT_EQ(lines[5], "Run status,Converted,Skipped,Failed,Time(s)");
    EXPECT_EQ(lines[6].rfind("completed,1,0,1,", 0), 0u);
}

TEST(RunReport, UnwritablePathReturnsFalse)
{
    testutil::TempDir dir;
    EXPECT_FALSE(export_csv_report(xlsxconv::ConversionSummary{}, dir / "missing/dir/report.csv"));
}
