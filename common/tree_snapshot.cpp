#include "tree_snapshot.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace {

EntryKind kindOf(const fs::file_status& status) {
    if (fs::is_symlink(status)) return EntryKind::OTHER;
    if (fs::is_directory(status)) return EntryKind::DIRECTORY;
    if (fs::is_regular_file(status)) return EntryKind::FILE;
    return EntryKind::OTHER;
}

void sortByPath(std::vector<Entry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.relativePath < b.relativePath;
    });
}

}

Result<TreeSnapshot> scanTree(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<TreeSnapshot>::Error("not a directory: " + root.string());
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<TreeSnapshot>::Error("cannot open " + root.string() + ": " + ec.message());
    }

    TreeSnapshot snapshot;
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        fs::path rel = entry.path().lexically_relative(root);

        std::error_code statusEc;
        fs::file_status status = entry.symlink_status(statusEc);
        if (statusEc) {
            // vanished between readdir and stat
            snapshot.warnings.push_back("cannot stat " + entry.path().string() + ": " + statusEc.message());
        } else {
            switch (kindOf(status)) {
                case EntryKind::FILE:
                    snapshot.files.emplace_back(rel, EntryKind::FILE);
                    break;
                case EntryKind::DIRECTORY:
                    snapshot.directories.emplace_back(rel, EntryKind::DIRECTORY);
                    break;
                case EntryKind::OTHER:
                    snapshot.others.emplace_back(rel, EntryKind::OTHER);
                    break;
            }
        }

        it.increment(ec);
        if (ec) {
            // a recursive_directory_iterator cannot be resumed after a failed increment
            snapshot.warnings.push_back("walk of " + root.string() + " stopped early: " + ec.message());
            break;
        }
    }

    sortByPath(snapshot.files);
    sortByPath(snapshot.directories);
    sortByPath(snapshot.others);
    return Result<TreeSnapshot>::Ok(std::move(snapshot));
}

Result<PathState> inspectPath(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Result<PathState>::Ok(PathState::MISSING);
    }
    if (ec) {
        return Result<PathState>::Error("cannot stat " + path.string() + ": " + ec.message());
    }

    switch (kindOf(status)) {
        case EntryKind::FILE:
            return Result<PathState>::Ok(PathState::FILE);
        case EntryKind::DIRECTORY:
            return Result<PathState>::Ok(PathState::DIRECTORY);
        case EntryKind::OTHER:
            break;
    }
    return Result<PathState>::Ok(PathState::OTHER);
}
