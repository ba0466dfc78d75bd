// tests/logger_tests.cpp
// -----------------------------------------------------------------------------
// Logger facade: sink fan-out, level parsing, failing sinks.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <stdexcept>

#include "logger.hpp"
#include "test_helpers.hpp"

namespace {

class ThrowingSink final : public ILogSink {
public:
    void log(LogLevel, std::string_view, std::string_view) override
    {
        throw std::runtime_error("disk full");
    }
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::clear_sinks(); }
    void TearDown() override { Logger::clear_sinks(); }

    std::vector<testutil::CaptureEntry> entries;
    std::mutex mtx;
};

} // namespace

TEST_F(LoggerTest, FansOutToEverySink)
{
    std::vector<testutil::CaptureEntry> second;
    std::mutex secondMtx;
    Logger::add_sink(std::make_unique<testutil::CaptureLogSink>(entries, mtx));
    Logger::add_sink(std::make_unique<testutil::CaptureLogSink>(second, secondMtx));
    EXPECT_EQ(Logger::sink_count(), 2u);

    Logger::log(LogLevel::Info, "hello", "test");
    Logger::log(LogLevel::Error, "boom");

    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(entries[0].message, "hello");
    EXPECT_EQ(entries[0].tag, "test");
    EXPECT_EQ(entries[1].level, LogLevel::Error);
    EXPECT_EQ(entries[1].tag, "xlsxconv");
}

TEST_F(LoggerTest, NullSinkIsIgnored)
{
    Logger::add_sink(nullptr);
    EXPECT_EQ(Logger::sink_count(), 0u);
}

TEST_F(LoggerTest, ThrowingSinkDoesNotStopOthers)
{
    Logger::add_sink(std::make_unique<ThrowingSink>());
    Logger::add_sink(std::make_unique<testutil::CaptureLogSink>(entries, mtx));

    EXPECT_NO_THROW(Logger::log(LogLevel::Warning, "still here"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "still here");
}

TEST(LoggerLevels, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("Info"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
    EXPECT_FALSE(Logger::string_to_level("verbose").has_value());
}

TEST(LoggerLevels, LevelNamesRoundTripThroughParser)
{
    for (const auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error}) {
        EXPECT_EQ(Logger::string_to_level(Logger::level_to_string(level)), level);
    }
}
