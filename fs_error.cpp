#include "fs_error.hpp"

FsError fs_error_from(const std::error_code& ec) {
    if (!ec) {
        return FsError::None;
    }

    if (ec == std::errc::no_such_file_or_directory) {
        return FsError::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return FsError::PermissionDenied;
    }
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
        return FsError::AlreadyExists;
    }
    if (ec == std::errc::invalid_argument || ec == std::errc::filename_too_long) {
        return FsError::InvalidName;
    }
    return FsError::IoOther;
}

std::string fs_error_message(FsError err) {
    switch (err) {
        case FsError::None:             return "ok";
        case FsError::NotFound:         return "not found";
        case FsError::PermissionDenied: return "permission denied";
        case FsError::AlreadyExists:    return "already exists";
        case FsError::InvalidName:      return "invalid name";
        case FsError::IoOther:          return "I/O error";
    }
    return "unknown error";
}
