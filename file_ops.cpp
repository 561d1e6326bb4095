#include "file_ops.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

FsError validate_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return FsError::InvalidName;
    }
    if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        return FsError::InvalidName;
    }
    return FsError::None;
}

bool path_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_within(const fs::path& path, const fs::path& ancestor) {
    const fs::path p = path.lexically_normal();
    const fs::path a = ancestor.lexically_normal();

    auto pit = p.begin();
    for (auto ait = a.begin(); ait != a.end(); ++ait, ++pit) {
        // A trailing separator shows up as an empty final element.
        if (ait->empty() && std::next(ait) == a.end()) {
            return true;
        }
        if (pit == p.end() || *pit != *ait) {
            return false;
        }
    }
    return true;
}

FsError make_file(const fs::path& path) {
    if (path_exists(path)) {
        return FsError::AlreadyExists;
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        std::error_code ec {errno, std::generic_category()};
        spdlog::warn("create file {} failed: {}", path.string(), ec.message());
        return fs_error_from(ec);
    }
    ::close(fd);

    spdlog::info("created file {}", path.string());
    return FsError::None;
}

FsError make_directory(const fs::path& path) {
    if (path_exists(path)) {
        return FsError::AlreadyExists;
    }

    std::error_code ec;
    fs::create_directory(path, ec);
    if (ec) {
        spdlog::warn("create directory {} failed: {}", path.string(), ec.message());
        return fs_error_from(ec);
    }

    spdlog::info("created directory {}", path.string());
    return FsError::None;
}

FsError rename_path(const fs::path& from, const fs::path& to) {
    if (!path_exists(from)) {
        return FsError::NotFound;
    }
    if (path_exists(to)) {
        return FsError::AlreadyExists;
    }

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        spdlog::warn("rename {} -> {} failed: {}", from.string(), to.string(), ec.message());
        return fs_error_from(ec);
    }

    spdlog::info("renamed {} -> {}", from.string(), to.string());
    return FsError::None;
}

FsError remove_path(const fs::path& path) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);
    if (!fs::exists(st)) {
        return FsError::NotFound;
    }

    if (fs::is_directory(st)) {
        fs::remove_all(path, ec);
    }
    else {
        fs::remove(path, ec);
    }

    if (ec) {
        spdlog::error("delete {} failed part way: {}", path.string(), ec.message());
        return fs_error_from(ec);
    }

    spdlog::info("deleted {}", path.string());
    return FsError::None;
}

FsError copy_path(const fs::path& from, const fs::path& to, bool overwrite) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(from, ec);
    if (!fs::exists(st)) {
        return FsError::NotFound;
    }
    if (!overwrite && path_exists(to)) {
        return FsError::AlreadyExists;
    }

    // An existing link at `to` is replaced, never written through.
    if (overwrite && (fs::is_symlink(st) || fs::is_symlink(fs::symlink_status(to, ec)))) {
        if (path_exists(to)) {
            FsError err = remove_path(to);
            if (err != FsError::None) {
                return err;
            }
        }
    }
    ec.clear();

    if (fs::is_symlink(st)) {
        fs::copy_symlink(from, to, ec);
    }
    else if (fs::is_directory(st)) {
        fs::copy_options opts = fs::copy_options::recursive | fs::copy_options::copy_symlinks;
        if (overwrite) {
            opts |= fs::copy_options::overwrite_existing;
        }
        fs::create_directories(to, ec);
        if (!ec) {
            fs::copy(from, to, opts, ec);
        }
    }
    else {
        fs::copy_file(from, to, overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none, ec);
    }

    if (ec) {
        spdlog::error("copy {} -> {} failed: {}", from.string(), to.string(), ec.message());
        return fs_error_from(ec);
    }

    spdlog::info("copied {} -> {}", from.string(), to.string());
    return FsError::None;
}

FsError move_path(const fs::path& from, const fs::path& to) {
    if (!path_exists(from)) {
        return FsError::NotFound;
    }

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        spdlog::info("moved {} -> {}", from.string(), to.string());
        return FsError::None;
    }

    if (ec != std::errc::cross_device_link) {
        spdlog::warn("move {} -> {} failed: {}", from.string(), to.string(), ec.message());
        return fs_error_from(ec);
    }

    spdlog::info("{} is on another filesystem, copying", to.string());
    FsError err = copy_path(from, to, false);
    if (err != FsError::None) {
        return err;
    }
    return remove_path(from);
}
