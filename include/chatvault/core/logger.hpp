#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace chatvault::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    // Falls back to spdlog's default logger until initialize() has run.
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}

#define LOG_TRACE(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CALL(::chatvault::core::Logger::get(), spdlog::level::critical, __VA_ARGS__)
