#pragma once
#include <filesystem>
#include <string>
#include "../common/result.hpp"
#include "../common/tree_snapshot.hpp"

// All writes to the replica tree go through here. Every operation reports
// failure through its Result and never throws for I/O errors.
class DestinationManager {
public:
    explicit DestinationManager(const std::string& replicaRoot);

    // Creates the replica root (and its parents) when missing.
    // data is true when something was created.
    Result<bool> ensureRoot();

    Result<TreeSnapshot> snapshot() const;
    Result<PathState> stateOf(const std::filesystem::path& rel) const;

    // create_directories semantics; data is true when something was created
    Result<bool> makeDirectory(const std::filesystem::path& rel);

    // Writes sourceFile's bytes to rel through a temporary sibling that is
    // renamed over the target, so a failed copy leaves the old replica file.
    Result<void> installFile(const std::filesystem::path& sourceFile, const std::filesystem::path& rel);

    // Removes whatever is at rel, recursively for directories.
    // data is false when there was nothing left to remove.
    Result<bool> removeEntry(const std::filesystem::path& rel);

    std::filesystem::path absolutePath(const std::filesystem::path& rel) const;
    const std::filesystem::path& root() const { return replicaRoot_; }

private:
    std::filesystem::path replicaRoot_;
};
