#include "file_tree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace fs = std::filesystem;

namespace {

FsError recursive_build(const fs::path& dir,
                        int depth,
                        const ExpansionSet& expanded,
                        bool show_hidden,
                        std::vector<Entry>& out)
{
    std::vector<Entry> children {};
    FsError err = load_directory(dir, depth, show_hidden, children);
    if (err != FsError::None) {
        return err;
    }

    for (auto& child : children) {
        const bool descend = child.is_directory() && expanded.count(child.path) > 0;
        child.is_expanded = descend;
        fs::path child_path = child.path;
        out.push_back(std::move(child));

        if (descend) {
            err = recursive_build(child_path, depth + 1, expanded, show_hidden, out);
            if (err != FsError::None) {
                return err;
            }
        }
    }
    return FsError::None;
}

}

std::string to_lower_ascii(const std::string& s) {
    std::string lower {s};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool entry_less(const Entry& a, const Entry& b) {
    if (a.is_directory() != b.is_directory()) {
        return a.is_directory();
    }

    const std::string la = to_lower_ascii(a.name);
    const std::string lb = to_lower_ascii(b.name);
    if (la != lb) {
        return la < lb;
    }
    return a.name < b.name;
}

FsError load_directory(const fs::path& dir, int depth, bool show_hidden, std::vector<Entry>& out) {
    std::error_code ec;
    fs::directory_iterator di {dir, ec};
    if (ec) {
        spdlog::warn("cannot list {}: {}", dir.string(), ec.message());
        return fs_error_from(ec);
    }

    std::vector<Entry> entries {};
    for (const fs::directory_iterator end {}; di != end; di.increment(ec)) {
        if (ec) {
            break;
        }

        Entry entry {};
        FsError err = load_entry(di->path(), depth, entry);
        if (err == FsError::NotFound) {
            // Removed between listing and stat.
            continue;
        }
        if (err != FsError::None) {
            return err;
        }

        if (!show_hidden && entry.is_hidden) {
            continue;
        }
        entries.push_back(std::move(entry));
    }
    if (ec) {
        spdlog::warn("listing {} interrupted: {}", dir.string(), ec.message());
        return fs_error_from(ec);
    }

    std::sort(entries.begin(), entries.end(), entry_less);
    out = std::move(entries);
    return FsError::None;
}

FsError build_tree(const fs::path& root,
                   const ExpansionSet& expanded,
                   bool show_hidden,
                   std::vector<Entry>& out)
{
    std::vector<Entry> entries {};
    FsError err = recursive_build(root, 0, expanded, show_hidden, entries);
    if (err != FsError::None) {
        return err;
    }

    spdlog::debug("built tree for {}: {} entries, {} expanded", root.string(), entries.size(), expanded.size());
    out = std::move(entries);
    return FsError::None;
}

FsError build_tree_fully_expanded(const fs::path& root,
                                  bool show_hidden,
                                  std::size_t max_entries,
                                  std::vector<Entry>& out,
                                  ExpansionSet& expanded_out,
                                  bool& truncated)
{
    std::vector<Entry> level {};
    FsError err = load_directory(root, 0, show_hidden, level);
    if (err != FsError::None) {
        return err;
    }

    // Directories open breadth first, and only when all of their children fit,
    // so the result is exactly what build_tree gives for the chosen set.
    ExpansionSet expanded {};
    std::size_t total = level.size();
    bool limited { false };

    while (!level.empty()) {
        std::vector<Entry> next {};
        for (const auto& entry : level) {
            if (!entry.is_directory()) {
                continue;
            }

            std::vector<Entry> children {};
            err = load_directory(entry.path, entry.depth + 1, show_hidden, children);
            if (err != FsError::None) {
                return err;
            }
            if (total + children.size() > max_entries) {
                limited = true;
                continue;
            }

            total += children.size();
            expanded.insert(entry.path);
            std::move(children.begin(), children.end(), std::back_inserter(next));
        }
        level = std::move(next);
    }

    std::vector<Entry> entries {};
    err = build_tree(root, expanded, show_hidden, entries);
    if (err != FsError::None) {
        return err;
    }

    out = std::move(entries);
    expanded_out = std::move(expanded);
    truncated = limited;
    return FsError::None;
}
