#ifndef ENTRY_H
#define ENTRY_H

#include "fs_error.hpp"

#include <filesystem>
#include <string>

enum class EntryKind {
    File,
    Directory,
    Symlink
};

// One row of the visible tree. Built fresh on every rebuild and never changed afterwards.
struct Entry {
    std::string name {};
    std::filesystem::path path {};
    EntryKind kind { EntryKind::File };
    bool is_hidden { false };
    bool is_expanded { false };
    int depth { 0 };
    bool is_executable { false };

    bool is_directory() const {
        return kind == EntryKind::Directory;
    }

    bool is_symlink() const {
        return kind == EntryKind::Symlink;
    }
};

// Stats `path` without following symlinks and fills `out`.
FsError load_entry(const std::filesystem::path& path, int depth, Entry& out);

#endif
