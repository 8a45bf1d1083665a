#include "split_file.hpp"
#include "chunk_error.hpp"
#include "chunk_metadata.hpp"
#include "console.hpp"
#include "file_saver.hpp"

#include <fmt/format.h>
#include <gsl/gsl>

#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

void check_directory_empty(const fs::path& directory)
{
   std::error_code error;

   const fs::directory_iterator entries{directory, error};

   if (error) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to read directory '{}': {}"sv,
                                    directory.string(), error.message())};
   }

   if (entries != fs::directory_iterator{}) {
      throw Chunk_error{Chunk_errc::already_populated,
                        fmt::format("Directory '{}' is not empty"sv, directory.string())};
   }
}

auto read_chunk(std::ifstream& input, std::vector<char>& buffer) -> std::size_t
{
   input.read(buffer.data(), gsl::narrow<std::streamsize>(buffer.size()));

   if (input.bad()) {
      throw Chunk_error{Chunk_errc::io_failure, "Failed to read source file"s};
   }

   return gsl::narrow<std::size_t>(input.gcount());
}
}

auto split_file(const fs::path& source, const fs::path& target_directory,
                const Split_options& options) -> Split_result
{
   Expects(options.chunk_size > 0);

   std::error_code error;

   if (!fs::is_regular_file(source, error)) {
      throw Chunk_error{Chunk_errc::not_found,
                        fmt::format("File '{}' does not exist"sv, source.string())};
   }

   File_saver file_saver{target_directory, options.verbose};

   check_directory_empty(file_saver.directory());

   std::ifstream input{source, std::ios::binary};

   if (!input) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to open file '{}'"sv, source.string())};
   }

   write_chunk_metadata(file_saver, source.filename().string());

   std::vector<char> buffer(options.chunk_size);
   Split_result result;

   for (auto size = read_chunk(input, buffer); size != 0; size = read_chunk(input, buffer)) {
      if (result.chunk_count == max_ordered_chunk_count) {
         console::warning("'{}' needs more than {} chunks, chunk names will no longer "
                          "sort in split order"sv,
                          source.string(), max_ordered_chunk_count);
      }

      file_saver.save_file(gsl::span<const char>{buffer.data(), size},
                           chunk_file_name(result.chunk_count));

      result.chunk_count += 1;
      result.total_bytes += size;

      if (input.eof()) break;
   }

   if (options.verbose) {
      console::info("Split '{}' ({} bytes) into {} chunks"sv, source.string(),
                    result.total_bytes, result.chunk_count);
   }

   return result;
}
