#include "destination_manager.hpp"
#include "../common/config.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string tempToken() {
    static std::mt19937_64 generator{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::uint64_t value = generator();
    std::string token;
    for (int i = 0; i < 16; ++i) {
        token += hex[value & 0xF];
        value >>= 4;
    }
    return token;
}

}

DestinationManager::DestinationManager(const std::string& replicaRoot) : replicaRoot_(replicaRoot) {}

Result<bool> DestinationManager::ensureRoot() {
    std::error_code ec;
    if (fs::is_directory(replicaRoot_, ec)) {
        return Result<bool>::Ok(false);
    }
    bool created = fs::create_directories(replicaRoot_, ec);
    if (ec) {
        return Result<bool>::Error("cannot create " + replicaRoot_.string() + ": " + ec.message());
    }
    return Result<bool>::Ok(created);
}

Result<TreeSnapshot> DestinationManager::snapshot() const {
    return scanTree(replicaRoot_);
}

Result<PathState> DestinationManager::stateOf(const fs::path& rel) const {
    return inspectPath(absolutePath(rel));
}

Result<bool> DestinationManager::makeDirectory(const fs::path& rel) {
    fs::path target = absolutePath(rel);
    std::error_code ec;
    bool created = fs::create_directories(target, ec);
    if (ec) {
        return Result<bool>::Error("cannot create directory " + target.string() + ": " + ec.message());
    }
    return Result<bool>::Ok(created);
}

Result<void> DestinationManager::installFile(const fs::path& sourceFile, const fs::path& rel) {
    fs::path target = absolutePath(rel);

    std::error_code ec;
    fs::path tempFile;
    bool copied = false;
    for (int attempt = 0; attempt < Config::TEMP_NAME_ATTEMPTS && !copied; ++attempt) {
        // short fixed-length name, so a target near NAME_MAX still has a usable sibling
        tempFile = target.parent_path() / (std::string(Config::TEMP_PREFIX) + tempToken() + ".tmp");

        // an existing entry under that name is someone else's
        if (fs::exists(fs::symlink_status(tempFile, ec))) continue;
        ec.clear();
        fs::copy_file(sourceFile, tempFile, fs::copy_options::none, ec);
        if (ec == std::errc::file_exists) continue;
        if (ec) {
            // the name was free before the copy, so anything there now is ours
            std::error_code cleanupEc;
            if (fs::exists(fs::symlink_status(tempFile, cleanupEc))) {
                fs::remove(tempFile, cleanupEc);
            }
            return Result<void>::Error("copy to " + tempFile.string() + " failed: " + ec.message());
        }
        copied = true;
    }
    if (!copied) {
        return Result<void>::Error("no free temporary name next to " + target.string());
    }

    // Atomic swap
    fs::rename(tempFile, target, ec);
    if (ec) {
        std::error_code cleanupEc;
        fs::remove(tempFile, cleanupEc);
        return Result<void>::Error("cannot replace " + target.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

Result<bool> DestinationManager::removeEntry(const fs::path& rel) {
    fs::path target = absolutePath(rel);
    std::error_code ec;
    std::uintmax_t removed = fs::remove_all(target, ec);
    if (ec) {
        return Result<bool>::Error("cannot remove " + target.string() + ": " + ec.message());
    }
    return Result<bool>::Ok(removed > 0);
}

fs::path DestinationManager::absolutePath(const fs::path& rel) const {
    return replicaRoot_ / rel;
}
