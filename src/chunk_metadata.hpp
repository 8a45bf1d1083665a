#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

class File_saver;

void write_chunk_metadata(File_saver& file_saver, std::string_view original_filename);

// Returns nullopt when the record is missing, unreadable or malformed.
auto read_original_filename(const std::filesystem::path& directory)
   -> std::optional<std::string>;
