#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "entry.hpp"
#include "result.hpp"

// Everything found beneath a root at the moment of the walk, each list sorted
// so that a directory comes before anything inside it. Subtrees that could
// not be read end up in warnings and are missing from the lists.
struct TreeSnapshot {
    std::vector<Entry> files;
    std::vector<Entry> directories;
    std::vector<Entry> others;
    std::vector<std::string> warnings;
};

// What currently sits at a path. Symlinks are reported as OTHER, never followed.
enum class PathState { MISSING, FILE, DIRECTORY, OTHER };

// Fails only when the root itself cannot be opened as a directory.
Result<TreeSnapshot> scanTree(const std::filesystem::path& root);

// Fails when the path cannot be examined (permission denied on a parent,
// I/O error); a path that does not exist is MISSING, not an error.
Result<PathState> inspectPath(const std::filesystem::path& path);
