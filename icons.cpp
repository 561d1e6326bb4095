#include "icons.hpp"
#include "file_tree.hpp"

#include <unordered_map>

namespace {

const char* DIR_OPEN = "󰉋 ";
const char* DIR_CLOSED = "󰉖 ";
const char* SYMLINK = " ";
const char* DEFAULT_FILE = " ";
const char* DOCKERFILE = " ";
const char* GIT = " ";
const char* LOCK = " ";

const std::unordered_map<std::string, std::string>& extension_icons() {
    static const std::unordered_map<std::string, std::string> icons {
        {"rs", " "},
        {"py", " "},
        {"js", " "},
        {"ts", " "},
        {"jsx", " "},
        {"tsx", " "},
        {"go", " "},
        {"rb", " "},
        {"php", " "},
        {"java", " "},
        {"c", " "},
        {"cpp", " "},
        {"h", " "},
        {"hpp", " "},
        {"cs", "󰌛 "},
        {"swift", " "},
        {"kt", " "},
        {"scala", " "},
        {"hs", " "},
        {"lua", " "},
        {"vim", " "},
        {"sh", " "},
        {"bash", " "},
        {"zsh", " "},
        {"fish", " "},
        {"html", " "},
        {"css", " "},
        {"scss", " "},
        {"sass", " "},
        {"less", " "},
        {"vue", " "},
        {"svelte", " "},
        {"json", " "},
        {"yaml", " "},
        {"yml", " "},
        {"toml", " "},
        {"xml", "󰗀 "},
        {"csv", " "},
        {"sql", " "},
        {"md", " "},
        {"txt", " "},
        {"pdf", " "},
        {"doc", "󰈬 "},
        {"docx", "󰈬 "},
        {"png", " "},
        {"jpg", " "},
        {"jpeg", " "},
        {"gif", " "},
        {"svg", "󰜡 "},
        {"ico", " "},
        {"webp", " "},
        {"zip", " "},
        {"tar", " "},
        {"gz", " "},
        {"rar", " "},
        {"7z", " "},
        {"gitignore", " "},
        {"docker", " "},
        {"env", " "},
        {"log", " "},
    };
    return icons;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

std::string icon_for(const Entry& entry) {
    if (entry.is_directory()) {
        return entry.is_expanded ? DIR_OPEN : DIR_CLOSED;
    }
    if (entry.is_symlink()) {
        return SYMLINK;
    }

    const std::string lower = to_lower_ascii(entry.name);
    if (lower == "dockerfile") {
        return DOCKERFILE;
    }
    if (lower.find(".git") != std::string::npos) {
        return GIT;
    }
    if (ends_with(lower, ".lock")) {
        return LOCK;
    }

    const std::size_t dot = lower.rfind('.');
    const std::string ext = dot == std::string::npos ? lower : lower.substr(dot + 1);

    const auto& icons = extension_icons();
    auto it = icons.find(ext);
    if (it == icons.end()) {
        return DEFAULT_FILE;
    }
    return it->second;
}
