#include "joplinreader/diagnostics/Logger.hpp"
#include "test_utils/TestUtils.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace
{

using joplinreader::diagnostics::LogLevel;
using joplinreader::diagnostics::Logger;

class LoggerTest : public ::testing::Test
{
protected:
    std::vector<std::pair<LogLevel, std::string>> captured;

    void SetUp() override
    {
        Logger::setSink([this](LogLevel level, std::string_view message) { captured.emplace_back(level, message); });
    }

    void TearDown() override
    {
        Logger::resetSink();
        Logger::init(LogLevel::Info);
    }
};

} // namespace

TEST_F(LoggerTest, DropsMessagesBelowLevel)
{
    Logger::init(LogLevel::Warn);
    EXPECT_EQ(Logger::level(), LogLevel::Warn);

    Logger::debug("d");
    Logger::info("i");
    Logger::warn("w");
    Logger::error("e");

    ASSERT_EQ(captured.size(), 2U);
    EXPECT_EQ(captured[0].first, LogLevel::Warn);
    EXPECT_EQ(captured[0].second, "w");
    EXPECT_EQ(captured[1].first, LogLevel::Error);
    EXPECT_EQ(captured[1].second, "e");
}

TEST_F(LoggerTest, DebugLevelPassesEverything)
{
    Logger::init(LogLevel::Debug);
    Logger::debug("one");
    Logger::info("two");
    EXPECT_EQ(captured.size(), 2U);
}

TEST_F(LoggerTest, ResetSinkStopsCapture)
{
    Logger::init(LogLevel::Debug);
    Logger::resetSink();
    ::testing::internal::CaptureStderr();
    Logger::info("to stderr");
    const auto err{ ::testing::internal::GetCapturedStderr() };

    EXPECT_TRUE(captured.empty());
    EXPECT_NE(err.find("[INFO]"), std::string::npos);
    EXPECT_NE(err.find("to stderr"), std::string::npos);
}

TEST_F(LoggerTest, SinkMayLogFromInsideTheCallback)
{
    Logger::init(LogLevel::Info);
    Logger::setSink([this](LogLevel level, std::string_view message) {
        captured.emplace_back(level, message);
        if (message == "outer")
        {
            Logger::warn("inner");
            EXPECT_EQ(Logger::level(), LogLevel::Info);
        }
    });

    Logger::info("outer");

    ASSERT_EQ(captured.size(), 2U);
    EXPECT_EQ(captured[0].second, "outer");
    EXPECT_EQ(captured[1].first, LogLevel::Warn);
    EXPECT_EQ(captured[1].second, "inner");
}

TEST_F(LoggerTest, AppendsTaggedLinesToLogFile)
{
    const joplinreader::test_utils::ScratchDir dir{ "logger_" };
    const auto file{ dir.path() / "reader.log" };

    Logger::init(LogLevel::Info, file.string());
    Logger::debug("hidden");
    Logger::warn("key skipped");
    Logger::init(LogLevel::Info);

    std::ifstream in{ file };
    std::stringstream content{};
    content << in.rdbuf();
    const auto text{ content.str() };
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("key skipped"), std::string::npos);
    EXPECT_EQ(captured.size(), 1U);
}
