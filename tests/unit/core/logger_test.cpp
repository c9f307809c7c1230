// GpuBind Core Tests
// logger_test.cpp - Tests for categorized logging

#include <gtest/gtest.h>

#include <gpubind/core/config.hpp>
#include <gpubind/core/logger.hpp>

#include <filesystem>

namespace gpubind::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::initialize(); }

    void TearDown() override { Logger::set_global_level(LogLevel::Info); }
};

TEST_F(LoggerTest, InitializeIsIdempotent) {
    EXPECT_TRUE(Logger::is_initialized());
    Logger::initialize();
    EXPECT_TRUE(Logger::is_initialized());
}

TEST_F(LoggerTest, CategoryLevelIsIndependent) {
    Logger::set_level(LogCategory::Buffer, LogLevel::Trace);
    EXPECT_EQ(Logger::level(LogCategory::Buffer), LogLevel::Trace);
    EXPECT_EQ(Logger::level(LogCategory::Command), LogLevel::Info);
}

TEST_F(LoggerTest, GlobalLevelResetsCategories) {
    Logger::set_level(LogCategory::Query, LogLevel::Trace);
    Logger::set_global_level(LogLevel::Error);
    EXPECT_EQ(Logger::level(LogCategory::Query), LogLevel::Error);
    EXPECT_EQ(Logger::level(LogCategory::Device), LogLevel::Error);
}

TEST_F(LoggerTest, MacrosAcceptFormatArguments) {
    Logger::set_level(LogCategory::Command, LogLevel::Off);
    GPUBIND_LOG_TRACE(LogCategory::Command, "suppressed {}", 1);
    GPUBIND_LOG_INFO(LogCategory::Device, "Logger test message {} {}", "with", 2);
    Logger::flush();
    SUCCEED();
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off", LogLevel::Error), LogLevel::Off);
    EXPECT_EQ(parse_log_level("loud", LogLevel::Error), LogLevel::Error);
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                       LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(to_string(level)), level);
    }
}

TEST(LogCategoryTest, ParsesNames) {
    EXPECT_EQ(parse_log_category("command"), LogCategory::Command);
    EXPECT_EQ(parse_log_category("gpubind"), LogCategory::Core);
    EXPECT_FALSE(parse_log_category("physics").has_value());
    EXPECT_STREQ(to_string(LogCategory::Texture), "texture");
}

TEST(LoggerConfigTest, ReadsLoggingSection) {
    Config config;
    ASSERT_TRUE(config.load_from_string(
        R"({"logging": {"level": "debug", "log_directory": "logs",
                        "categories": {"command": "trace", "physics": "trace", "query": "bogus"}}})"));

    auto logger_config = LoggerConfig::from_config(config);
    EXPECT_EQ(logger_config.console_level, LogLevel::Debug);
    EXPECT_EQ(logger_config.log_directory, std::filesystem::path("logs"));

    // Unknown categories are dropped, unknown levels fall back to the console level
    ASSERT_EQ(logger_config.category_levels.size(), 2u);
    EXPECT_EQ(logger_config.category_levels[0].first, LogCategory::Command);
    EXPECT_EQ(logger_config.category_levels[0].second, LogLevel::Trace);
    EXPECT_EQ(logger_config.category_levels[1].first, LogCategory::Query);
    EXPECT_EQ(logger_config.category_levels[1].second, LogLevel::Debug);
}

TEST(LoggerConfigTest, DefaultsToConsoleOnly) {
    Config config;
    auto logger_config = LoggerConfig::from_config(config);
    EXPECT_EQ(logger_config.console_level, LogLevel::Info);
    EXPECT_TRUE(logger_config.log_directory.empty());
    EXPECT_TRUE(logger_config.category_levels.empty());
}

}  // namespace
}  // namespace gpubind::core
