#include "shell.hpp"
#include "chunk_error.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

auto read_line(std::istream& in) -> std::string
{
   std::string line;

   if (!std::getline(in, line)) return {};

   return std::string{trim_whitespace(line)};
}

bool holds_chunk_files(const fs::path& directory)
{
   try {
      return !list_chunk_files(directory).empty();
   }
   catch (Chunk_error&) {
      return false;
   }
}

auto list_subdirectories(const fs::path& directory) -> std::vector<fs::path>
{
   std::vector<fs::path> subdirectories;
   std::error_code error;

   fs::directory_iterator entries{directory, error};

   for (; !error && entries != fs::directory_iterator{}; entries.increment(error)) {
      std::error_code status_error;

      if (entries->is_directory(status_error)) subdirectories.emplace_back(entries->path());
   }

   std::sort(std::begin(subdirectories), std::end(subdirectories),
             [](const fs::path& left, const fs::path& right) {
                return (left.filename().native() < right.filename().native());
             });

   return subdirectories;
}

void print_chunk_summary(const fs::path& directory, std::ostream& out)
{
   try {
      const auto chunk_count = list_chunk_files(directory).size();

      if (chunk_count != 0) {
         out << fmt::format("\tFound {} chunk files in this directory.\n"sv, chunk_count);
      }
      else {
         out << "\tNo chunk files found in this directory.\n"sv;
      }
   }
   catch (Chunk_error& e) {
      out << fmt::format("\tUnable to read this directory: {}\n"sv, e.what());
   }
}
}

auto parent_navigation_entry(const fs::path& directory) -> std::optional<Navigation_entry>
{
   if (!directory.has_relative_path()) return std::nullopt;

   return Navigation_entry{{".."s, Entry_kind::directory}, directory.parent_path()};
}

auto list_navigation_entries(const fs::path& directory) -> std::vector<Navigation_entry>
{
   std::vector<Navigation_entry> entries;

   if (auto parent = parent_navigation_entry(directory)) {
      entries.push_back(std::move(*parent));
   }

   for (const auto& subdirectory : list_subdirectories(directory)) {
      const auto kind =
         holds_chunk_files(subdirectory) ? Entry_kind::chunk_set : Entry_kind::directory;

      entries.push_back({{subdirectory.filename().string(), kind}, subdirectory});
   }

   return entries;
}

auto run_split_flow(std::istream& in, std::ostream& out, const Split_options& options)
   -> int
{
   out << "Enter the path to the file to split\n>>> "sv << std::flush;

   const fs::path source = read_line(in);

   std::error_code error;

   if (source.empty() || !fs::is_regular_file(source, error)) {
      out << "File does not exist.\n"sv;

      return EXIT_FAILURE;
   }

   out << "Give a directory to save the chunks\n>>> "sv << std::flush;

   const fs::path target_directory = read_line(in);

   try {
      split_file(source, target_directory, options);
   }
   catch (Chunk_error& e) {
      out << fmt::format("Error during splitting: {}\n"sv, e.what());

      return EXIT_FAILURE;
   }

   out << "File split successfully.\n"sv;

   return EXIT_SUCCESS;
}

auto run_reconstruct_flow(fs::path directory, std::istream& in, std::ostream& out,
                          const Reconstruct_options& options) -> int
{
   while (true) {
      out << fmt::format("\n>>>\t{}\n"sv, directory.string());

      print_chunk_summary(directory, out);

      const auto navigation = list_navigation_entries(directory);

      std::vector<Menu_entry> entries;
      entries.reserve(navigation.size() + 2);

      for (const auto& nav : navigation) entries.push_back(nav.entry);

      entries.push_back({"Reconstruct"s, Entry_kind::action});
      entries.push_back({"Exit"s, Entry_kind::exit});

      const auto choice = prompt_menu(""sv, entries, in, out);

      if (!choice || entries[*choice].kind == Entry_kind::exit) return EXIT_SUCCESS;

      if (*choice < navigation.size()) {
         directory = navigation[*choice].target;

         continue;
      }

      try {
         const auto name = reconstruct_file(directory, options);

         out << fmt::format("Reconstructed file saved as \"{}\".\n"sv, name);
      }
      catch (Chunk_error& e) {
         out << fmt::format("Error during reconstruction: {}\n"sv, e.what());
      }

      return EXIT_SUCCESS;
   }
}

auto run_interactive_shell(const fs::path& start_directory, std::istream& in,
                           std::ostream& out, const bool verbose) -> int
{
   const std::vector<Menu_entry> entries{{"Exit"s, Entry_kind::exit},
                                         {"Reconstruct file"s, Entry_kind::action},
                                         {"Split file"s, Entry_kind::action}};

   const auto choice = prompt_menu("Reconstruct or split file:"sv, entries, in, out);

   if (!choice) return EXIT_SUCCESS;

   switch (*choice) {
   case 1:
      return run_reconstruct_flow(start_directory, in, out,
                                  Reconstruct_options{.verbose = verbose});
   case 2:
      return run_split_flow(in, out, Split_options{.verbose = verbose});
   default:
      return EXIT_SUCCESS;
   }
}
