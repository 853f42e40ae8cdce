// HexForge Core
// logger.cpp - spdlog-backed category logger

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <hexforge/core/logger.hpp>
#include <hexforge/platform/file_io.hpp>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace hexforge::core {

namespace {

constexpr std::array<const char*, 7> LEVEL_NAMES = {"trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S] [%^%l%$] %v";
constexpr const char* CONSOLE_PATTERN_PLAIN = "[%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

// The console logger is filtered by the global and per-category levels. The
// optional file logger keeps its own threshold so the log file records debug
// detail regardless of what the console shows.
struct LoggerState {
    std::mutex mutex;
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Off;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> console;
    std::shared_ptr<spdlog::logger> file;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

// Caller holds the state mutex
LogLevel level_for(const LoggerState& s, std::string_view category) {
    auto it = s.category_levels.find(std::string(category));
    return it != s.category_levels.end() ? it->second : s.global_level;
}

bool at_least(LogLevel level, LogLevel threshold) {
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

// Caller holds the state mutex
bool console_accepts(const LoggerState& s, LogLevel level, std::string_view category) {
    return at_least(level, level_for(s, category));
}

// Caller holds the state mutex
bool file_accepts(const LoggerState& s, LogLevel level) {
    return s.file && at_least(level, s.file_level);
}

std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr sink) {
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

spdlog::sink_ptr make_console_sink(const LoggerConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(config.include_timestamps ? CONSOLE_PATTERN : CONSOLE_PATTERN_PLAIN);
    return sink;
}

spdlog::sink_ptr make_file_sink(const LoggerConfig& config, std::filesystem::path& log_path) {
    std::filesystem::path dir = config.log_directory;
    if (dir.empty()) {
        dir = platform::FileSystem::get_user_data_directory() / "logs";
    }
    // Not FileSystem::create_directories: it logs on failure and the state mutex is held here
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    log_path = dir / config.log_filename;
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path.string(), config.max_file_size,
                                                                       config.max_files);
    sink->set_pattern(FILE_PATTERN);
    return sink;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (name == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "info";
}

// ============================================================================
// Lifecycle
// ============================================================================

void Logger::initialize(const LoggerConfig& config) {
    auto& s = state();
    std::filesystem::path log_path;
    std::string file_error;

    {
        std::lock_guard lock(s.mutex);
        if (s.initialized) {
            return;
        }

        s.console = make_logger("hexforge", make_console_sink(config));

        if (config.file_output) {
            try {
                s.file = make_logger("hexforge_file", make_file_sink(config, log_path));
                s.file_level = config.file_level;
            } catch (const spdlog::spdlog_ex& ex) {
                // Console only when the log file cannot be opened
                file_error = ex.what();
                log_path.clear();
            }
        }

        s.global_level = config.console_level;
        s.initialized = true;
    }

    // The lock is released here; the log calls below take it again
    if (!file_error.empty()) {
        warn(log_category::APP, "Log file disabled: {}", file_error);
    }
    debug(log_category::APP, "Logger initialized (console level {})", log_level_name(config.console_level));
    if (!log_path.empty()) {
        debug(log_category::APP, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        return;
    }

    s.console->flush();
    if (s.file) {
        s.file->flush();
    }
    s.console.reset();
    s.file.reset();
    s.file_level = LogLevel::Off;
    s.category_levels.clear();
    s.initialized = false;

    // spdlog's default logger is left alone; messages logged after shutdown go through it
    spdlog::default_logger_raw()->flush();
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.initialized;
}

// ============================================================================
// Levels
// ============================================================================

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.category_levels.insert_or_assign(std::string(category), level);
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return level_for(s, category);
}

void Logger::set_global_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

LogLevel Logger::get_global_level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.global_level;
}

void Logger::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.console) {
        s.console->flush();
    }
    if (s.file) {
        s.file->flush();
    }
}

// ============================================================================
// Dispatch
// ============================================================================

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    // Before initialize() spdlog's default logger does its own filtering
    return !s.initialized || console_accepts(s, level, category) || file_accepts(s, level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (!s.initialized) {
        spdlog::default_logger_raw()->log(to_spdlog(level), "[{}] {}", category, message);
        return;
    }
    if (console_accepts(s, level, category)) {
        s.console->log(to_spdlog(level), "[{}] {}", category, message);
    }
    if (file_accepts(s, level)) {
        s.file->log(to_spdlog(level), "[{}] {}", category, message);
    }
}

}  // namespace hexforge::core
