// Crumble Engine Core
// logger.cpp - Category logger implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <crumble/core/logger.hpp>
#include <crumble/platform/file_io.hpp>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace crumble::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
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
        default:
            return spdlog::level::info;
    }
}

// Resolve the effective level for a category; caller holds the mutex
LogLevel level_for(const LoggerState& state, std::string_view category) {
    auto it = state.category_levels.find(std::string(category));
    return it != state.category_levels.end() ? it->second : state.global_level;
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) {
    if (name == "trace") {
        return LogLevel::Trace;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "critical") {
        return LogLevel::Critical;
    }
    if (name == "off") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Critical:
            return "critical";
        case LogLevel::Off:
            return "off";
        default:
            return "info";
    }
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(config.console_level));
        console_sink->set_pattern(config.include_timestamps ? "[%H:%M:%S] [%^%l%$] %v" : "[%^%l%$] %v");
        sinks.push_back(console_sink);

        if (config.enable_file_output) {
            try {
                std::filesystem::path log_dir = config.log_directory;
                if (log_dir.empty()) {
                    log_dir = platform::FileSystem::get_user_data_directory() / "logs";
                }
                if (!platform::FileSystem::exists(log_dir)) {
                    platform::FileSystem::create_directories(log_dir);
                }

                log_path = log_dir / config.log_filename;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                // Console output still works without the file sink
                spdlog::error("Log file sink unavailable: {}", ex.what());
                log_path.clear();
            }
        }

        state.logger = std::make_shared<spdlog::logger>("crumble", sinks.begin(), sinks.end());
        state.logger->set_level(spdlog::level::trace);
        state.logger->flush_on(spdlog::level::warn);

        state.global_level = config.console_level;
        state.initialized = true;
    }

    // Logged after the lock is released, log_message takes it again
    log(LogLevel::Info, log_category::ENGINE, "Logger initialized");
    if (!log_path.empty()) {
        log(LogLevel::Info, log_category::ENGINE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.logger) {
        state.logger->flush();
    }

    state.logger.reset();
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return level_for(state, category);
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // spdlog's default logger applies its own level
        return true;
    }

    return static_cast<int>(level) >= static_cast<int>(level_for(state, category));
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized || !state.logger) {
        spdlog::log(to_spdlog_level(level), "[{}] {}", category, message);
        return;
    }

    state.logger->log(to_spdlog_level(level), "[{}] {}", category, message);
}

}  // namespace crumble::core
