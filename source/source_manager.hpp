#pragma once
#include <filesystem>
#include <string>
#include "../common/result.hpp"
#include "../common/tree_snapshot.hpp"

// Read-only view of the source tree. Nothing here ever writes to the source.
class SourceManager {
public:
    explicit SourceManager(const std::string& sourceRoot);

    bool rootExists() const;
    Result<TreeSnapshot> snapshot() const;

    // true only for a regular file (or directory) at rel; symlinks do not count
    Result<bool> hasFile(const std::filesystem::path& rel) const;
    Result<bool> hasDirectory(const std::filesystem::path& rel) const;

    std::filesystem::path absolutePath(const std::filesystem::path& rel) const;
    const std::filesystem::path& root() const { return sourceRoot_; }

private:
    std::filesystem::path sourceRoot_;
};
