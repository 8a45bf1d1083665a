#include "app_options.hpp"
#include "chunk_error.hpp"
#include "console.hpp"
#include "reconstruct_file.hpp"
#include "shell.hpp"
#include "split_file.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

const auto usage = R"(Usage: chunk-split <options>

Without options the interactive menu is started.

Options:)"s;

void print_usage()
{
   std::cout << usage;
   App_options{0, nullptr}.print_arguments(std::cout);
}

int interactive_mode(const App_options& options)
{
   return run_interactive_shell(fs::current_path(), std::cin, std::cout,
                                options.verbose());
}

int split_mode(const App_options& options)
{
   if (options.source_file().empty() || options.chunk_directory().empty()) {
      console::error("Split mode needs both -file and -dir."sv);
      print_usage();

      return EXIT_FAILURE;
   }

   try {
      const auto result = split_file(options.source_file(), options.chunk_directory(),
                                     Split_options{.verbose = options.verbose()});

      std::cout << fmt::format("Split '{}' into {} chunks in '{}'.\n"sv,
                               options.source_file(), result.chunk_count,
                               options.chunk_directory());
   }
   catch (Chunk_error& e) {
      console::error("Splitting failed ({}).\n   Message: {}"sv, to_string_view(e.code()),
                     e.what());

      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

int reconstruct_mode(const App_options& options)
{
   if (options.chunk_directory().empty()) {
      console::error("Reconstruct mode needs -dir."sv);
      print_usage();

      return EXIT_FAILURE;
   }

   try {
      const auto name = reconstruct_file(options.chunk_directory(),
                                         Reconstruct_options{.verbose = options.verbose()});

      std::cout << fmt::format("Reconstructed file saved as \"{}\".\n"sv, name);
   }
   catch (Chunk_error& e) {
      console::error("Reconstruction failed ({}).\n   Message: {}"sv,
                     to_string_view(e.code()), e.what());

      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

auto get_mode_processor(const Tool_mode mode) -> std::function<int(const App_options&)>
{
   if (mode == Tool_mode::interactive) return interactive_mode;
   if (mode == Tool_mode::split) return split_mode;
   if (mode == Tool_mode::reconstruct) return reconstruct_mode;

   throw std::invalid_argument{"Unknown tool mode."};
}

int main(int argc, char* argv[])
{
   try {
      const App_options app_options{argc, argv};

      if (app_options.show_help()) {
         print_usage();

         return EXIT_SUCCESS;
      }

      const auto processor = get_mode_processor(app_options.tool_mode());

      return processor(app_options);
   }
   catch (std::exception& e) {
      console::error("Exception occured.\n   Message: {}"sv, e.what());

      return EXIT_FAILURE;
   }
}
