#include "source_manager.hpp"
#include <system_error>

namespace fs = std::filesystem;

SourceManager::SourceManager(const std::string& sourceRoot) : sourceRoot_(sourceRoot) {}

bool SourceManager::rootExists() const {
    std::error_code ec;
    return fs::is_directory(sourceRoot_, ec);
}

Result<TreeSnapshot> SourceManager::snapshot() const {
    return scanTree(sourceRoot_);
}

Result<bool> SourceManager::hasFile(const fs::path& rel) const {
    auto state = inspectPath(absolutePath(rel));
    if (!state.success) {
        return Result<bool>::Error(state.message);
    }
    return Result<bool>::Ok(state.data == PathState::FILE);
}

Result<bool> SourceManager::hasDirectory(const fs::path& rel) const {
    auto state = inspectPath(absolutePath(rel));
    if (!state.success) {
        return Result<bool>::Error(state.message);
    }
    return Result<bool>::Ok(state.data == PathState::DIRECTORY);
}

fs::path SourceManager::absolutePath(const fs::path& rel) const {
    return sourceRoot_ / rel;
}
