#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <filesystem>
#include <vector>

namespace lcars::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

constexpr size_t MAX_LOG_SIZE = 5 * 1024 * 1024;
constexpr size_t MAX_LOG_FILES = 3;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

} // namespace

LogLevel log_level_from_string(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    if (lower == "warning") {
        return LogLevel::Warn;
    }

    // spdlog maps unknown names to "off", so only accept "off" when asked for
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return fallback;
    }
    return static_cast<LogLevel>(level);
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(to_spdlog(level));
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    // An empty path logs to the console only (journald picks it up)
    std::string file_error;
    if (!log_file.empty()) {
        auto parent = std::filesystem::path(log_file).parent_path();
        if (!parent.empty() && !utils::FileUtils::create_directories(parent)) {
            file_error = "cannot create directory " + parent.string();
        }
    }

    if (!log_file.empty() && file_error.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, MAX_LOG_SIZE, MAX_LOG_FILES);
            file_sink->set_level(spdlog::level::debug);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    logger_ = std::make_shared<spdlog::logger>("lcars", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(to_spdlog(level));

    if (!file_error.empty()) {
        LOG_ERROR("Cannot open log file {}: {}", log_file, file_error);
    }
    LOG_INFO("Logging at level {}", spdlog::level::to_string_view(to_spdlog(level)));
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }

    logger_->flush();
    spdlog::drop_all();
    logger_.reset();

    // LOG_* stays usable once the file sink is closed
    spdlog::set_default_logger(spdlog::stdout_color_mt("lcars-console"));
}

}
