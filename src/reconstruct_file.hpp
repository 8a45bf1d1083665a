#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct Reconstruct_options {
   bool verbose = false;
};

// Chunk files of directory sorted by name. Throws Chunk_error if the directory
// can not be read.
auto list_chunk_files(const std::filesystem::path& directory)
   -> std::vector<std::filesystem::path>;

// Concatenates the chunk files of directory into a file named after the metadata
// record (or the fallback name) in the same directory and returns that name.
auto reconstruct_file(const std::filesystem::path& directory,
                      const Reconstruct_options& options = {}) -> std::string;
