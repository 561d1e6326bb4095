#ifndef FILE_OPS_H
#define FILE_OPS_H

#include "fs_error.hpp"

#include <filesystem>
#include <string>

// Rejects empty names, "." and "..", and anything containing a path separator.
FsError validate_name(const std::string& name);

// True if something (including a dangling symlink) exists at `path`.
bool path_exists(const std::filesystem::path& path);

// True if `path` equals `ancestor` or lies underneath it, compared lexically.
bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor);

FsError make_file(const std::filesystem::path& path);

FsError make_directory(const std::filesystem::path& path);

// Fails with AlreadyExists instead of replacing an existing `to`.
FsError rename_path(const std::filesystem::path& from, const std::filesystem::path& to);

// Directories are removed recursively; symlinks are removed, never followed.
// A failure part way through a directory leaves whatever was not yet removed.
FsError remove_path(const std::filesystem::path& path);

// Copies a file, symlink or directory tree. With `overwrite` existing files in the
// destination are replaced and directories merged. Stops at the first failure,
// leaving the partial copy in place.
FsError copy_path(const std::filesystem::path& from, const std::filesystem::path& to, bool overwrite);

// Renames, falling back to copy + remove when `to` is on another filesystem.
FsError move_path(const std::filesystem::path& from, const std::filesystem::path& to);

#endif
