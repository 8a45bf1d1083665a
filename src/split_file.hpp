#pragma once

#include "chunk_naming.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

struct Split_options {
   std::size_t chunk_size = default_chunk_size;
   bool verbose = false;
};

struct Split_result {
   std::size_t chunk_count = 0;
   std::uint64_t total_bytes = 0;
};

// Splits source into chunk files plus a metadata record inside target_directory.
// Throws Chunk_error. The target directory is created if needed and must be empty;
// a missing source is reported before the target directory is touched.
auto split_file(const std::filesystem::path& source,
                const std::filesystem::path& target_directory,
                const Split_options& options = {}) -> Split_result;
