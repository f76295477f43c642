// Crumble Engine Core
// logger.hpp - Category logger on top of spdlog

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace crumble::core {

// Mirrors spdlog's levels so callers never include spdlog enums directly
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool enable_file_output = true;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "crumble.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names map to Info.
[[nodiscard]] LogLevel log_level_from_string(std::string_view name);
[[nodiscard]] const char* log_level_to_string(LogLevel level);

// Process-wide logger. Messages carry a category tag and are filtered
// against that category's level (the global level when none is set).
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    template<typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        log_message(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* GRID = "grid";
    inline constexpr const char* COLLAPSE = "collapse";
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace crumble::core

#define CRUMBLE_LOG_TRACE(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Trace, category, __VA_ARGS__)

#define CRUMBLE_LOG_DEBUG(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Debug, category, __VA_ARGS__)

#define CRUMBLE_LOG_INFO(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Info, category, __VA_ARGS__)

#define CRUMBLE_LOG_WARN(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Warn, category, __VA_ARGS__)

#define CRUMBLE_LOG_ERROR(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Error, category, __VA_ARGS__)

#define CRUMBLE_LOG_CRITICAL(category, ...) \
    ::crumble::core::Logger::log(::crumble::core::LogLevel::Critical, category, __VA_ARGS__)
