#ifndef PREVIEW_H
#define PREVIEW_H

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

enum class PreviewKind {
    Text,
    Directory,
    Binary,
    TooLarge,
    Empty,
    Error
};

struct PreviewChild {
    std::string name {};
    bool is_directory { false };
};

struct Preview {
    std::filesystem::path path {};
    PreviewKind kind { PreviewKind::Empty };

    std::uintmax_t size {};
    unsigned permissions {};
    bool has_modified { false };
    std::time_t modified {};

    std::vector<std::string> lines {};
    std::vector<PreviewChild> children {};
    std::string error {};
};

constexpr std::size_t MAX_PREVIEW_LINES = 25;
constexpr std::uintmax_t MAX_PREVIEW_SIZE = 50 * 1024;
constexpr std::size_t BINARY_CHECK_SIZE = 512;
constexpr std::size_t MAX_PREVIEW_LINE_LENGTH = 200;

// Reads a bounded preview of `path`. Never fails; problems are reported as PreviewKind::Error.
Preview load_preview(const std::filesystem::path& path);

std::string format_size(std::uintmax_t bytes);

std::string format_permissions(unsigned mode);

std::string format_time(std::time_t t);

#endif
