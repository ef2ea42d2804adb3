#include "railguard/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace railguard {
namespace logging {

void reportSinkError(const std::string& message) {
    std::cerr << "railguard: log write failed: " << message << std::endl;
}

std::shared_ptr<spdlog::logger> initializeLogging(const config::MonitorConfig& config) {
    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (config.debugMode) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
        logger->set_level(spdlog::level::debug);
    } else {
        std::filesystem::path logPath(config.logPath);
        if (logPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(logPath.parent_path(), ec);
            if (ec) {
                reportSinkError("cannot create " + logPath.parent_path().string() + ": " + ec.message());
            }
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logPath, config.maxLogSize, config.maxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger = std::make_shared<spdlog::logger>(kLoggerName, file_sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
    }

    logger->set_error_handler(reportSinkError);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace logging
} // namespace railguard
