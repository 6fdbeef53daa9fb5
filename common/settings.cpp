#include "settings.hpp"
#include "config.hpp"
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

Result<int> parseInterval(const std::string& value) {
    size_t consumed = 0;
    int seconds = 0;
    try {
        seconds = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        return Result<int>::Error("invalid sync interval: " + value);
    }
    if (consumed != value.size()) {
        return Result<int>::Error("invalid sync interval: " + value);
    }
    if (seconds <= 0) {
        return Result<int>::Error("sync interval must be a positive number of seconds");
    }
    return Result<int>::Ok(seconds);
}

}

Result<Settings> parseArguments(int argc, const char* const* argv, const fs::path& workingDir) {
    Settings settings;
    settings.sourceFolder = (workingDir / Config::DEFAULT_FOLDERS_DIR / Config::DEFAULT_SOURCE_DIR).string();
    settings.replicaFolder = (workingDir / Config::DEFAULT_FOLDERS_DIR / Config::DEFAULT_REPLICA_DIR).string();
    settings.logFile = (workingDir / Config::DEFAULT_LOG_DIR / Config::DEFAULT_LOG_FILE).string();
    settings.syncInterval = Config::DEFAULT_SYNC_INTERVAL;

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--once") { settings.runOnce = true; continue; }
        if (arg == "--verbose" || arg == "-v") { settings.verbose = true; continue; }
        if (arg == "--help" || arg == "-h") { settings.showHelp = true; continue; }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return Result<Settings>::Error("unknown option: " + std::string(arg));
        }
        positional.emplace_back(arg);
    }

    if (positional.size() > 4) {
        return Result<Settings>::Error("unexpected extra argument: " + positional[4]);
    }
    if (positional.size() > 0) settings.sourceFolder = positional[0];
    if (positional.size() > 1) settings.replicaFolder = positional[1];
    if (positional.size() > 2) {
        auto interval = parseInterval(positional[2]);
        if (!interval.success) {
            return Result<Settings>::Error(interval.message);
        }
        settings.syncInterval = interval.data;
    }
    if (positional.size() > 3) settings.logFile = positional[3];

    if (settings.sourceFolder.empty() || settings.replicaFolder.empty() || settings.logFile.empty()) {
        return Result<Settings>::Error("paths must not be empty");
    }
    return Result<Settings>::Ok(settings);
}

std::string usage() {
    return "Usage: dirmirror [options] [source] [replica] [interval-seconds] [log-file]\n"
           "Options:\n"
           "  --once         Run a single synchronization cycle and exit\n"
           "  --verbose, -v  Also log debug lines\n"
           "  --help, -h     Show this help\n"
           "Defaults: ./Folders/SourceFolder ./Folders/ReplicaFolder 60 ./LogFile/log.txt\n";
}
