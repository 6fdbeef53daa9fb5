#include "sync_engine.hpp"
#include "../common/file_comparator.hpp"
#include "../destination/destination_manager.hpp"
#include "../source/source_manager.hpp"
#include <exception>
#include <utility>

namespace fs = std::filesystem;

namespace {

const char* failureContext(SyncAction action) {
    switch (action) {
        case SyncAction::CREATE_DIRECTORY: return "Error creating directory";
        case SyncAction::COPY_FILE:
        case SyncAction::UPDATE_FILE:      return "Error processing file";
        case SyncAction::REPLACE_ENTRY:    return "Error removing mismatched entry";
        case SyncAction::DELETE_FILE:      return "Error deleting file";
        case SyncAction::DELETE_DIRECTORY: return "Error deleting directory";
        case SyncAction::SCAN:             return "Error scanning";
    }
    return "Error";
}

}

SyncEngine::SyncEngine(const std::string& sourcePath, const std::string& replicaPath, std::shared_ptr<spdlog::logger> logger)
    : sourcePath_(sourcePath), replicaPath_(replicaPath), logger_(std::move(logger)) {}

Result<CycleReport> SyncEngine::runCycle() {
    SourceManager source(sourcePath_);
    DestinationManager replica(replicaPath_);
    FileComparator comparator(logger_);

    logger_->debug("Synchronizing from {} to {}", sourcePath_, replicaPath_);

    // a missing source must never reach the deletion passes
    if (!source.rootExists()) {
        return Result<CycleReport>::Error("source folder " + sourcePath_ + " does not exist");
    }

    CycleReport report;
    auto root = replica.ensureRoot();
    if (!root.success) {
        return Result<CycleReport>::Error(root.message);
    }
    if (root.data) {
        done(report, SyncAction::CREATE_DIRECTORY, replica.root());
    }

    auto sourceTree = source.snapshot();
    if (!sourceTree.success) {
        return Result<CycleReport>::Error(sourceTree.message);
    }
    recordWarnings(sourceTree.data, source.root(), report);
    for (const Entry& other : sourceTree.data.others) {
        logger_->debug("Skipping {} (not a regular file or directory)", source.absolutePath(other.relativePath).string());
    }

    propagateDirectories(sourceTree.data, replica, report);
    propagateFiles(sourceTree.data, source, replica, comparator, report);

    auto replicaTree = replica.snapshot();
    if (!replicaTree.success) {
        // keep what propagation already did; deletions wait for the next cycle
        fail(report, SyncAction::SCAN, replica.root(), replicaTree.message);
        return Result<CycleReport>::Ok(std::move(report));
    }
    recordWarnings(replicaTree.data, replica.root(), report);

    pruneFiles(replicaTree.data, source, replica, report);
    pruneDirectories(replicaTree.data, source, replica, report);

    return Result<CycleReport>::Ok(std::move(report));
}

bool SyncEngine::synchronize() {
    auto result = runCycle();
    if (!result.success) {
        logger_->error("Synchronization aborted: {}", result.message);
        return false;
    }
    return result.data.changed();
}

void SyncEngine::propagateDirectories(const TreeSnapshot& tree, DestinationManager& replica, CycleReport& report) {
    for (const Entry& dir : tree.directories) {
        fs::path target = replica.absolutePath(dir.relativePath);
        try {
            auto state = replica.stateOf(dir.relativePath);
            if (!state.success) {
                fail(report, SyncAction::CREATE_DIRECTORY, target, state.message);
                continue;
            }
            if (state.data == PathState::DIRECTORY) continue;
            if (state.data != PathState::MISSING && !replaceMismatched(dir.relativePath, replica, report)) continue;

            auto made = replica.makeDirectory(dir.relativePath);
            if (!made.success) {
                fail(report, SyncAction::CREATE_DIRECTORY, target, made.message);
            } else if (made.data) {
                done(report, SyncAction::CREATE_DIRECTORY, target);
            }
        } catch (const std::exception& e) {
            fail(report, SyncAction::CREATE_DIRECTORY, target, e.what());
        }
    }
}

void SyncEngine::propagateFiles(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica,
                                const FileComparator& comparator, CycleReport& report) {
    for (const Entry& file : tree.files) {
        const fs::path& rel = file.relativePath;
        fs::path sourceFile = source.absolutePath(rel);
        fs::path replicaFile = replica.absolutePath(rel);
        try {
            auto state = replica.stateOf(rel);
            if (!state.success) {
                fail(report, SyncAction::COPY_FILE, sourceFile, state.message);
                continue;
            }

            if (state.data == PathState::FILE) {
                if (comparator.filesAreEqual(sourceFile.string(), replicaFile.string())) continue;

                auto installed = replica.installFile(sourceFile, rel);
                if (!installed.success) {
                    fail(report, SyncAction::UPDATE_FILE, sourceFile, installed.message);
                } else {
                    done(report, SyncAction::UPDATE_FILE, replicaFile);
                }
                continue;
            }

            if (state.data != PathState::MISSING && !replaceMismatched(rel, replica, report)) continue;

            if (rel.has_parent_path()) {
                // normally made by propagateDirectories, unless the source grew since the scan
                auto parent = replica.makeDirectory(rel.parent_path());
                if (!parent.success) {
                    fail(report, SyncAction::COPY_FILE, sourceFile, parent.message);
                    continue;
                }
                if (parent.data) {
                    done(report, SyncAction::CREATE_DIRECTORY, replicaFile.parent_path());
                }
            }

            auto installed = replica.installFile(sourceFile, rel);
            if (!installed.success) {
                fail(report, SyncAction::COPY_FILE, sourceFile, installed.message);
            } else {
                done(report, SyncAction::COPY_FILE, replicaFile);
            }
        } catch (const std::exception& e) {
            fail(report, SyncAction::COPY_FILE, sourceFile, e.what());
        }
    }
}

void SyncEngine::pruneFiles(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica, CycleReport& report) {
    auto prune = [&](const Entry& entry) {
        fs::path target = replica.absolutePath(entry.relativePath);
        try {
            auto inSource = source.hasFile(entry.relativePath);
            if (!inSource.success) {
                // cannot tell, so keep the replica copy
                fail(report, SyncAction::DELETE_FILE, target, inSource.message);
                return;
            }
            if (inSource.data) return;

            auto removed = replica.removeEntry(entry.relativePath);
            if (!removed.success) {
                fail(report, SyncAction::DELETE_FILE, target, removed.message);
            } else if (removed.data) {
                done(report, SyncAction::DELETE_FILE, target);
            }
        } catch (const std::exception& e) {
            fail(report, SyncAction::DELETE_FILE, target, e.what());
        }
    };

    for (const Entry& file : tree.files) prune(file);
    // symlinks and special files are never mirrored, so any in the replica are foreign
    for (const Entry& other : tree.others) prune(other);
}

void SyncEngine::pruneDirectories(const TreeSnapshot& tree, const SourceManager& source, DestinationManager& replica, CycleReport& report) {
    for (const Entry& dir : tree.directories) {
        fs::path target = replica.absolutePath(dir.relativePath);
        try {
            auto state = replica.stateOf(dir.relativePath);
            if (state.success && state.data == PathState::MISSING) continue; // went with its parent

            auto inSource = source.hasDirectory(dir.relativePath);
            if (!inSource.success) {
                fail(report, SyncAction::DELETE_DIRECTORY, target, inSource.message);
                continue;
            }
            if (inSource.data) continue;

            auto removed = replica.removeEntry(dir.relativePath);
            if (!removed.success) {
                fail(report, SyncAction::DELETE_DIRECTORY, target, removed.message);
            } else if (removed.data) {
                done(report, SyncAction::DELETE_DIRECTORY, target);
            }
        } catch (const std::exception& e) {
            fail(report, SyncAction::DELETE_DIRECTORY, target, e.what());
        }
    }
}

bool SyncEngine::replaceMismatched(const fs::path& rel, DestinationManager& replica, CycleReport& report) {
    fs::path target = replica.absolutePath(rel);
    auto removed = replica.removeEntry(rel);
    if (!removed.success) {
        fail(report, SyncAction::REPLACE_ENTRY, target, removed.message);
        return false;
    }
    done(report, SyncAction::REPLACE_ENTRY, target);
    return true;
}

void SyncEngine::recordWarnings(const TreeSnapshot& tree, const fs::path& root, CycleReport& report) {
    for (const auto& warning : tree.warnings) {
        fail(report, SyncAction::SCAN, root, warning);
    }
}

void SyncEngine::done(CycleReport& report, SyncAction action, const fs::path& path) {
    logger_->info("{}: {}", describe(action), path.string());
    report.record(EntryOutcome::done(action, path.string()));
}

void SyncEngine::fail(CycleReport& report, SyncAction action, const fs::path& path, const std::string& reason) {
    logger_->error("{} {}: {}", failureContext(action), path.string(), reason);
    report.record(EntryOutcome::failed(action, path.string(), reason));
}
