#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    // Console sink plus an appending file sink at logFile. When the file
    // cannot be opened the logger still works, console only.
    static std::shared_ptr<spdlog::logger> init(const std::string& logFile, spdlog::level::level_enum logLevel);

    static constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S] [%l] %v";

private:
    static inline std::shared_ptr<spdlog::logger> logger_;
};
