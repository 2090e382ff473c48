#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"
#include <spdlog/pattern_formatter.h>

namespace chatvault::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("chatvault", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_DEBUG("Shutting down logger");
        logger_->flush();

        // Release the file sink but keep a usable default for late log calls.
        auto console = std::make_shared<spdlog::logger>(
            "", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        spdlog::set_default_logger(console);
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    return spdlog::default_logger();
}

}
