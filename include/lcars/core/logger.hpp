#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace lcars::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

LogLevel log_level_from_string(const std::string& name, LogLevel fallback = LogLevel::Info);

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    // Falls back to spdlog's default logger before initialize()
    static std::shared_ptr<spdlog::logger> get() {
        return logger_ ? logger_ : spdlog::default_logger();
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace lcars::core

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::lcars::core::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::lcars::core::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::lcars::core::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::lcars::core::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::lcars::core::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::lcars::core::Logger::get(), __VA_ARGS__)
