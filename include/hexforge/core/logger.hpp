// HexForge Core
// logger.hpp - Category logging with console and rotating file output

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace hexforge::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);
[[nodiscard]] const char* log_level_name(LogLevel level);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool file_output = true;                      // Generation runs are batch jobs, keep a log by default
    std::filesystem::path log_directory;          // Empty = <user data dir>/logs
    std::string log_filename = "hexforge.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Static logging interface
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Console threshold for categories without an explicit level. The log file
    // keeps LoggerConfig::file_level whatever the console levels are.
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* APP = "app";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* GENERATOR = "generator";
    inline constexpr const char* LAYOUT = "layout";
    inline constexpr const char* GEOMETRY = "geometry";
    inline constexpr const char* SCENE = "scene";
    inline constexpr const char* EXPORT = "export";
    inline constexpr const char* IO = "io";
}  // namespace log_category

}  // namespace hexforge::core

#define HEXFORGE_LOG_TRACE(category, ...) \
    ::hexforge::core::Logger::trace(category, __VA_ARGS__)

#define HEXFORGE_LOG_DEBUG(category, ...) \
    ::hexforge::core::Logger::debug(category, __VA_ARGS__)

#define HEXFORGE_LOG_INFO(category, ...) \
    ::hexforge::core::Logger::info(category, __VA_ARGS__)

#define HEXFORGE_LOG_WARN(category, ...) \
    ::hexforge::core::Logger::warn(category, __VA_ARGS__)

#define HEXFORGE_LOG_ERROR(category, ...) \
    ::hexforge::core::Logger::error(category, __VA_ARGS__)

#define HEXFORGE_LOG_CRITICAL(category, ...) \
    ::hexforge::core::Logger::critical(category, __VA_ARGS__)
