// config.hpp
#pragma once
#include <cstddef>

namespace Config {
    inline constexpr int DEFAULT_SYNC_INTERVAL = 60;            // seconds between two cycles
    inline constexpr std::size_t DIGEST_BUFFER_SIZE = 64 * 1024; // read size while hashing a file

    // replacement copies are written to <dir>/<TEMP_PREFIX><token>.tmp first, then renamed
    inline constexpr const char* TEMP_PREFIX = ".mirror-";
    inline constexpr int TEMP_NAME_ATTEMPTS = 16;

    // defaults are resolved against the working directory
    inline constexpr const char* DEFAULT_FOLDERS_DIR = "Folders";
    inline constexpr const char* DEFAULT_SOURCE_DIR = "SourceFolder";
    inline constexpr const char* DEFAULT_REPLICA_DIR = "ReplicaFolder";
    inline constexpr const char* DEFAULT_LOG_DIR = "LogFile";
    inline constexpr const char* DEFAULT_LOG_FILE = "log.txt";

    inline constexpr const char* LOGGER_NAME = "dirmirror";
}
