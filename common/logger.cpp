#include "logger.hpp"
#include "config.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::init(const std::string& logFile, spdlog::level::level_enum logLevel) {
    namespace fs = std::filesystem;
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(logLevel);
    sinks.push_back(consoleSink);

    fs::path logPath(logFile);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[Logger] Cannot create log directory " << logPath.parent_path()
                      << ": " << ec.message() << "\n";
        }
    }

    try {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false /* append */);
        fileSink->set_level(logLevel);
        sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "[Logger] Error writing to log file: " << e.what() << "\n";
    }

    if (logger_) {
        spdlog::drop(logger_->name());
    }
    logger_ = std::make_shared<spdlog::logger>(Config::LOGGER_NAME, begin(sinks), end(sinks));
    logger_->set_pattern(LOG_PATTERN);
    logger_->set_level(logLevel);
    logger_->flush_on(spdlog::level::info);
    spdlog::register_logger(logger_);
    return logger_;
}
