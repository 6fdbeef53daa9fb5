#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "cycle_report.hpp"
#include "../common/result.hpp"
#include "../common/tree_snapshot.hpp"

class SourceManager;
class DestinationManager;
class FileComparator;

// One-way mirror of sourcePath into replicaPath. Holds no state between
// cycles: every runCycle() walks both trees again from scratch.
//
// Order inside a cycle: replica root, source directories, source files,
// replica files missing from the source, replica directories missing from
// the source. Propagation finishes before anything is deleted, so a file
// moved inside the source is written to its new place before the old copy
// goes away.
class SyncEngine {
public:
    SyncEngine(const std::string& sourcePath, const std::string& replicaPath, std::shared_ptr<spdlog::logger> logger);

    // Fails only when the cycle cannot start (source root gone, replica root
    // cannot be created or source root cannot be read). Per-entry failures
    // are in the report.
    Result<CycleReport> runCycle();

    // runCycle() reduced to "did anything change"; an aborted cycle is false
    bool synchronize();

private:
    std::string sourcePath_;
    std::string replicaPath_;
    std::shared_ptr<spdlog::logger> logger_;

    void propagateDirectories(const TreeSnapshot& tree, DestinationManager& replica, CycleReport& report);
    void propagateFiles(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica,
                        const FileComparator& comparator, CycleReport& report);
    void pruneFiles(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica, CycleReport& report);
    void pruneDirectories(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica, CycleReport& report);

    bool replaceMismatched(const std::filesystem::path& rel, DestinationManager& replica, CycleReport& report);
    void recordWarnings(const TreeSnapshot& tree, const std::filesystem::path& root, CycleReport& report);

    void done(CycleReport& report, SyncAction action, const std::filesystem::path& path);
    void fail(CycleReport& report, SyncAction action, const std::filesystem::path& path, const std::string& reason);
};
