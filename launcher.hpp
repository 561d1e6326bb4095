#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <filesystem>
#include <string>
#include <vector>

// $EDITOR split on whitespace, or "vim" when unset or blank.
std::vector<std::string> editor_command();

// Runs the editor on `file` and waits for it. The caller must have handed the
// terminal over first.
bool run_editor(const std::filesystem::path& file, std::string& error);

// Hands `dir` to the desktop opener (xdg-open, or open on macOS) with its output discarded.
bool open_in_file_manager(const std::filesystem::path& dir, std::string& error);

#endif
