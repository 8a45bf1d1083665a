#pragma once

#include <gsl/gsl>

#include <filesystem>
#include <fstream>
#include <string_view>

// Writes named files into a single flat directory, creating it on construction.
class File_saver {
public:
   File_saver(const std::filesystem::path& path, bool verbose = false);

   void save_file(gsl::span<const char> contents, std::string_view name);

   void save_text(std::string_view contents, std::string_view name);

   auto open_save_file(std::string_view name,
                       std::ios_base::openmode openmode = std::ios::binary |
                                                          std::ios::trunc)
      -> std::ofstream;

   auto build_file_path(std::string_view name) const -> std::filesystem::path;

   auto directory() const noexcept -> const std::filesystem::path&;

   bool verbose() const noexcept;

private:
   const std::filesystem::path _path;
   const bool _verbose = false;
};
