#include "chunk_metadata.hpp"
#include "chunk_naming.hpp"
#include "file_saver.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

const auto original_filename_key = "original_filename"s;

auto read_file_text(const fs::path& path) -> std::optional<std::string>
{
   std::ifstream file{path, std::ios::binary};

   if (!file) return std::nullopt;

   std::string text{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

   if (file.bad()) return std::nullopt;

   return text;
}
}

void write_chunk_metadata(File_saver& file_saver, std::string_view original_filename)
{
   nlohmann::json record;
   record[original_filename_key] = std::string{original_filename};

   // Names that are not valid UTF-8 are stored with replacement characters.
   file_saver.save_text(
      record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
      metadata_file_name);
}

auto read_original_filename(const fs::path& directory) -> std::optional<std::string>
{
   const auto path = directory / metadata_file_name;

   std::error_code error;

   if (!fs::is_regular_file(path, error)) return std::nullopt;

   const auto text = read_file_text(path);

   if (!text) return std::nullopt;

   const auto record = nlohmann::json::parse(*text, nullptr, false);

   if (record.is_discarded() || !record.is_object()) return std::nullopt;

   const auto field = record.find(original_filename_key);

   if (field == record.end() || !field->is_string()) return std::nullopt;

   return field->get<std::string>();
}
