#include "reconstruct_file.hpp"
#include "chunk_error.hpp"
#include "chunk_metadata.hpp"
#include "chunk_naming.hpp"
#include "console.hpp"
#include "file_saver.hpp"

#include <fmt/format.h>
#include <gsl/gsl>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

constexpr std::size_t copy_buffer_size = 1024 * 1024;

auto resolve_output_name(const fs::path& directory, const bool verbose) -> std::string
{
   const auto stored_name = read_original_filename(directory);

   if (!stored_name) {
      if (verbose) {
         console::info("No usable {} in '{}', saving as '{}'"sv, metadata_file_name,
                       directory.string(), fallback_output_name);
      }

      return std::string{fallback_output_name};
   }

   // Only the last component is used so the output stays inside the directory.
   auto name = fs::path{*stored_name}.filename().string();

   if (name.empty() || name == "."sv || name == ".."sv) {
      if (verbose) {
         console::info("Stored name '{}' is not a file name, saving as '{}'"sv,
                       *stored_name, fallback_output_name);
      }

      return std::string{fallback_output_name};
   }

   return name;
}

void append_chunk(const fs::path& chunk_path, std::ofstream& output,
                  std::vector<char>& buffer)
{
   std::ifstream chunk{chunk_path, std::ios::binary};

   if (!chunk) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to open chunk '{}'"sv, chunk_path.string())};
   }

   while (chunk) {
      chunk.read(buffer.data(), gsl::narrow<std::streamsize>(buffer.size()));

      if (chunk.bad()) {
         throw Chunk_error{Chunk_errc::io_failure,
                           fmt::format("Failed to read chunk '{}'"sv, chunk_path.string())};
      }

      const auto read = chunk.gcount();

      if (read == 0) break;

      output.write(buffer.data(), read);

      if (!output) {
         throw Chunk_error{Chunk_errc::io_failure, "Failed to write reconstructed file"s};
      }
   }
}
}

auto list_chunk_files(const fs::path& directory) -> std::vector<fs::path>
{
   std::error_code error;

   fs::directory_iterator entries{directory, error};

   if (error) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to read directory '{}': {}"sv,
                                    directory.string(), error.message())};
   }

   std::vector<fs::path> chunks;

   for (; entries != fs::directory_iterator{}; entries.increment(error)) {
      std::error_code status_error;

      if (!entries->is_regular_file(status_error)) continue;

      const auto name = entries->path().filename().string();

      if (is_chunk_file_name(name)) chunks.emplace_back(entries->path());
   }

   if (error) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to read directory '{}': {}"sv,
                                    directory.string(), error.message())};
   }

   std::sort(std::begin(chunks), std::end(chunks),
             [](const fs::path& left, const fs::path& right) {
                return (left.filename().native() < right.filename().native());
             });

   return chunks;
}

auto reconstruct_file(const fs::path& directory, const Reconstruct_options& options)
   -> std::string
{
   std::error_code error;

   if (!fs::is_directory(directory, error)) {
      throw Chunk_error{Chunk_errc::not_found,
                        fmt::format("Directory '{}' does not exist"sv, directory.string())};
   }

   const auto name = resolve_output_name(directory, options.verbose);

   // Listed before the output is created so it is never read back into itself.
   const auto chunks = list_chunk_files(directory);

   const auto collides = std::any_of(std::cbegin(chunks), std::cend(chunks),
                                     [&name](const fs::path& chunk) {
                                        return (chunk.filename().string() == name);
                                     });

   if (collides) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Output name '{}' would overwrite a chunk file"sv,
                                    name)};
   }

   File_saver file_saver{directory, options.verbose};

   auto output = file_saver.open_save_file(name);

   std::vector<char> buffer(copy_buffer_size);

   for (const auto& chunk : chunks) {
      append_chunk(chunk, output, buffer);
   }

   output.close();

   if (!output) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Failed to write reconstructed file '{}'"sv,
                                    file_saver.build_file_path(name).string())};
   }

   if (options.verbose) {
      console::info("Reconstructed '{}' from {} chunks"sv, name, chunks.size());
   }

   return name;
}
