#pragma once
#include <filesystem>
#include <string>
#include <utility>

// OTHER covers symlinks, FIFOs, sockets and devices: never mirrored
enum class EntryKind { FILE, DIRECTORY, OTHER };

struct Entry {
    std::filesystem::path relativePath; // relative to the tree root it was found under
    EntryKind kind;

    Entry(std::filesystem::path rel, EntryKind k)
        : relativePath(std::move(rel)), kind(k) {}
};
