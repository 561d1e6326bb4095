#include "preview.hpp"
#include "file_tree.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

std::string clean_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::string out {};
    for (char c : line) {
        if (c == '\t') {
            out.append(4, ' ');
        }
        else {
            out.push_back(c);
        }
    }

    if (out.size() > MAX_PREVIEW_LINE_LENGTH) {
        out.resize(MAX_PREVIEW_LINE_LENGTH);
        out += "...";
    }
    return out;
}

void load_directory_preview(Preview& preview) {
    std::vector<Entry> entries {};
    FsError err = load_directory(preview.path, 0, true, entries);
    if (err != FsError::None) {
        preview.kind = PreviewKind::Error;
        preview.error = fs_error_message(err);
        return;
    }

    if (entries.empty()) {
        preview.kind = PreviewKind::Empty;
        return;
    }

    preview.kind = PreviewKind::Directory;
    for (const auto& e : entries) {
        preview.children.push_back(PreviewChild{e.name, e.is_directory()});
    }
}

void load_file_preview(Preview& preview) {
    if (preview.size == 0) {
        preview.kind = PreviewKind::Empty;
        return;
    }
    if (preview.size > MAX_PREVIEW_SIZE) {
        preview.kind = PreviewKind::TooLarge;
        return;
    }

    std::ifstream in(preview.path, std::ios::binary);
    if (!in.is_open()) {
        preview.kind = PreviewKind::Error;
        preview.error = "cannot open file";
        return;
    }

    std::vector<char> head(BINARY_CHECK_SIZE, 0);
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    const std::streamsize got = in.gcount();
    for (std::streamsize i = 0; i < got; ++i) {
        if (head[static_cast<std::size_t>(i)] == '\0') {
            preview.kind = PreviewKind::Binary;
            return;
        }
    }

    in.clear();
    in.seekg(0, std::ios::beg);

    std::string line;
    while (preview.lines.size() < MAX_PREVIEW_LINES && std::getline(in, line)) {
        preview.lines.push_back(clean_line(line));
    }

    preview.kind = preview.lines.empty() ? PreviewKind::Empty : PreviewKind::Text;
}

}

Preview load_preview(const fs::path& path) {
    Preview preview {};
    preview.path = path;

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        preview.kind = PreviewKind::Error;
        preview.error = std::strerror(errno);
        spdlog::debug("preview stat failed for {}: {}", path.string(), preview.error);
        return preview;
    }

    preview.size = static_cast<std::uintmax_t>(st.st_size);
    preview.permissions = static_cast<unsigned>(st.st_mode);
    preview.has_modified = true;
    preview.modified = st.st_mtime;

    if (S_ISDIR(st.st_mode)) {
        load_directory_preview(preview);
    }
    else {
        load_file_preview(preview);
    }
    return preview;
}

std::string format_size(std::uintmax_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    char buffer[32];
    const double b = static_cast<double>(bytes);
    if (b >= GB) {
        std::snprintf(buffer, sizeof(buffer), "%.1f GB", b / GB);
    }
    else if (b >= MB) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", b / MB);
    }
    else if (b >= KB) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", b / KB);
    }
    else {
        return std::to_string(bytes) + " B";
    }
    return buffer;
}

std::string format_permissions(unsigned mode) {
    if (mode == 0) {
        return "---";
    }
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%o", mode & 0777u);
    return buffer;
}

std::string format_time(std::time_t t) {
    std::tm tm {};
    if (::localtime_r(&t, &tm) == nullptr) {
        return "---";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", &tm);
    return buffer;
}
