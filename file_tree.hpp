#ifndef FILE_TREE_H
#define FILE_TREE_H

#include "entry.hpp"
#include "fs_error.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

using ExpansionSet = std::set<std::filesystem::path>;

// Directories first, then case-insensitive name, then exact name.
bool entry_less(const Entry& a, const Entry& b);

std::string to_lower_ascii(const std::string& s);

// Lists one directory level, sorted and filtered. Children are stat'd but never descended into.
FsError load_directory(const std::filesystem::path& dir, int depth, bool show_hidden, std::vector<Entry>& out);

// Pre-order flattening of `root`, descending only into directories found in `expanded`.
// On failure `out` is left untouched.
FsError build_tree(const std::filesystem::path& root,
                   const ExpansionSet& expanded,
                   bool show_hidden,
                   std::vector<Entry>& out);

// Expands every directory whose children still fit within `max_entries` rows,
// shallowest first. `out` equals build_tree(root, expanded_out, show_hidden);
// `truncated` is set when some directory stayed collapsed because of the limit.
FsError build_tree_fully_expanded(const std::filesystem::path& root,
                                  bool show_hidden,
                                  std::size_t max_entries,
                                  std::vector<Entry>& out,
                                  ExpansionSet& expanded_out,
                                  bool& truncated);

#endif
