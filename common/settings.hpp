#pragma once
#include <filesystem>
#include <string>
#include "config.hpp"
#include "result.hpp"

// Everything the driver needs, fixed once at startup
struct Settings {
    std::string sourceFolder;
    std::string replicaFolder;
    std::string logFile;
    int syncInterval = Config::DEFAULT_SYNC_INTERVAL; // seconds
    bool runOnce = false;
    bool verbose = false;
    bool showHelp = false;
};

// dirmirror [--once] [--verbose] [source] [replica] [interval] [log-file]
// Missing positionals fall back to defaults under workingDir.
Result<Settings> parseArguments(int argc, const char* const* argv, const std::filesystem::path& workingDir);

std::string usage();
