#pragma once

#include "menu.hpp"
#include "reconstruct_file.hpp"
#include "split_file.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

struct Navigation_entry {
   Menu_entry entry;
   std::filesystem::path target;
};

// ".." entry leading to the parent of directory, none for a root path.
auto parent_navigation_entry(const std::filesystem::path& directory)
   -> std::optional<Navigation_entry>;

// Subdirectories of directory sorted by name, preceded by ".." when it has a
// parent. Subdirectories holding chunk files are tagged as chunk sets.
auto list_navigation_entries(const std::filesystem::path& directory)
   -> std::vector<Navigation_entry>;

auto run_split_flow(std::istream& in, std::ostream& out, const Split_options& options)
   -> int;

auto run_reconstruct_flow(std::filesystem::path directory, std::istream& in,
                          std::ostream& out, const Reconstruct_options& options) -> int;

// Top level menu. Returns the process exit code.
auto run_interactive_shell(const std::filesystem::path& start_directory,
                           std::istream& in, std::ostream& out, const bool verbose)
   -> int;
