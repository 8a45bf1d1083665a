#include "file_saver.hpp"
#include "chunk_error.hpp"
#include "console.hpp"

#include <fmt/format.h>

#include <system_error>

namespace fs = std::filesystem;
using namespace std::literals;

File_saver::File_saver(const fs::path& path, bool verbose)
   : _path{path.lexically_normal()}, _verbose{verbose}
{
   std::error_code error;

   fs::create_directories(_path, error);

   if (error) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to create directory '{}': {}"sv,
                                    _path.string(), error.message())};
   }

   if (!fs::is_directory(_path, error)) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("'{}' is not a directory"sv, _path.string())};
   }
}

void File_saver::save_file(gsl::span<const char> contents, std::string_view name)
{
   auto file = open_save_file(name);

   file.write(contents.data(), gsl::narrow<std::streamsize>(contents.size()));
   file.close();

   if (!file) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Failed to write file '{}'"sv,
                                    build_file_path(name).string())};
   }
}

void File_saver::save_text(std::string_view contents, std::string_view name)
{
   save_file(gsl::span<const char>{contents.data(), contents.size()}, name);
}

auto File_saver::open_save_file(std::string_view name, std::ios_base::openmode openmode)
   -> std::ofstream
{
   const auto path = build_file_path(name);

   if (_verbose) {
      console::info("Saving file {}"sv, path.string());
   }

   std::ofstream file{path, openmode | std::ios::out};

   if (!file) {
      throw Chunk_error{Chunk_errc::io_failure,
                        fmt::format("Unable to create file '{}'"sv, path.string())};
   }

   return file;
}

auto File_saver::build_file_path(std::string_view name) const -> fs::path
{
   return _path / name;
}

auto File_saver::directory() const noexcept -> const fs::path&
{
   return _path;
}

bool File_saver::verbose() const noexcept
{
   return _verbose;
}
