#ifndef FS_ERROR_H
#define FS_ERROR_H

#include <string>
#include <system_error>

enum class FsError {
    None,
    NotFound,
    PermissionDenied,
    AlreadyExists,
    InvalidName,
    IoOther
};

// Maps a std::filesystem error code onto the explorer's error taxonomy.
FsError fs_error_from(const std::error_code& ec);

std::string fs_error_message(FsError err);

#endif
