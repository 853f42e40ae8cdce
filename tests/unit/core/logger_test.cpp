// HexForge Core Tests
// logger_test.cpp - Log level parsing and category filtering

#include <gtest/gtest.h>

#include <hexforge/core/logger.hpp>
#include <hexforge/platform/file_io.hpp>

namespace hexforge::core {
namespace {

TEST(LogLevelTest, ParsesEveryLevelName) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, RejectsUnknownNames) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
    EXPECT_FALSE(parse_log_level("INFO").has_value());
}

TEST(LogLevelTest, NamesMatchParser) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                       LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(log_level_name(level)), level);
    }
}

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir_;

    void SetUp() override {
        log_dir_ = platform::FileSystem::get_temp_directory() / "hexforge_logger_test";
        LoggerConfig config;
        config.console_level = LogLevel::Warn;
        config.log_directory = log_dir_;
        Logger::initialize(config);
    }

    void TearDown() override {
        Logger::shutdown();
        platform::FileSystem::remove_all(log_dir_);
    }
};

TEST_F(LoggerTest, InitializeIsIdempotent) {
    EXPECT_TRUE(Logger::is_initialized());
    Logger::initialize();
    EXPECT_TRUE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobal) {
    Logger::set_category_level(log_category::SCENE, LogLevel::Trace);

    EXPECT_EQ(Logger::get_category_level(log_category::SCENE), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::EXPORT), LogLevel::Warn);
}

TEST_F(LoggerTest, GlobalLevelChange) {
    Logger::set_global_level(LogLevel::Error);
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::GENERATOR), LogLevel::Error);
}

TEST_F(LoggerTest, WritesLogFile) {
    HEXFORGE_LOG_ERROR(log_category::APP, "Test message {}", 42);
    Logger::flush();

    EXPECT_TRUE(platform::FileSystem::exists(log_dir_ / "hexforge.log"));
}

TEST_F(LoggerTest, FileReceivesDebugBelowConsoleLevel) {
    HEXFORGE_LOG_DEBUG(log_category::GENERATOR, "Placed {} pillar anchors", 6);
    HEXFORGE_LOG_TRACE(log_category::GENERATOR, "Below both sinks");
    Logger::flush();

    auto content = platform::FileSystem::read_text(log_dir_ / "hexforge.log");
    ASSERT_TRUE(content.has_value());
    EXPECT_NE(content->find("[generator] Placed 6 pillar anchors"), std::string::npos);
    EXPECT_EQ(content->find("Below both sinks"), std::string::npos);
}

TEST_F(LoggerTest, FileLevelIgnoresConsoleLevelChanges) {
    Logger::set_global_level(LogLevel::Error);
    Logger::set_category_level(log_category::LAYOUT, LogLevel::Off);

    HEXFORGE_LOG_DEBUG(log_category::LAYOUT, "Ring radius {}", 3.5);
    Logger::flush();

    auto content = platform::FileSystem::read_text(log_dir_ / "hexforge.log");
    ASSERT_TRUE(content.has_value());
    EXPECT_NE(content->find("[layout] Ring radius 3.5"), std::string::npos);
}

TEST_F(LoggerTest, ShutdownClearsCategoryLevels) {
    Logger::set_category_level(log_category::LAYOUT, LogLevel::Trace);
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());

    // Logging without an initialized logger falls back to spdlog's default logger
    HEXFORGE_LOG_INFO(log_category::LAYOUT, "After shutdown");

    LoggerConfig config;
    config.console_level = LogLevel::Warn;
    config.file_output = false;
    Logger::initialize(config);
    EXPECT_EQ(Logger::get_category_level(log_category::LAYOUT), LogLevel::Warn);
}

}  // namespace
}  // namespace hexforge::core
