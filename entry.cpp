#include "entry.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

FsError load_entry(const fs::path& path, int depth, Entry& out) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);

    if (st.type() == fs::file_type::not_found) {
        return FsError::NotFound;
    }
    if (ec) {
        spdlog::debug("stat failed for {}: {}", path.string(), ec.message());
        return fs_error_from(ec);
    }

    Entry entry {};
    entry.path = path;
    entry.name = path.filename().string();
    if (entry.name.empty()) {
        entry.name = path.string();
    }
    entry.depth = depth;
    entry.is_hidden = !entry.name.empty() && entry.name[0] == '.';

    // Symlinks are classified before directories so a link to a directory never expands.
    if (fs::is_symlink(st)) {
        entry.kind = EntryKind::Symlink;
    }
    else if (fs::is_directory(st)) {
        entry.kind = EntryKind::Directory;
    }
    else {
        entry.kind = EntryKind::File;
    }

#ifdef _WIN32
    entry.is_executable = false;
#else
    if (entry.kind == EntryKind::File) {
        const fs::perms exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
        entry.is_executable = (st.permissions() & exec_bits) != fs::perms::none;
    }
#endif

    out = std::move(entry);
    return FsError::None;
}
