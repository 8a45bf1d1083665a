#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

enum class Tool_mode { interactive, split, reconstruct };

class App_options {
public:
   App_options(const App_options&) = delete;
   App_options& operator=(const App_options&) = delete;
   App_options(App_options&&) = delete;
   App_options& operator=(App_options&&) = delete;

   App_options(const int argc, char* argv[]);

   Tool_mode tool_mode() const noexcept;

   auto source_file() const noexcept -> const std::string&;

   auto chunk_directory() const noexcept -> const std::string&;

   bool verbose() const noexcept;

   bool show_help() const noexcept;

   void print_arguments(std::ostream& ostream) const;

private:
   App_options();

   using Option_handler = std::function<void(std::istream&)>;

   struct Option {
      std::string name;
      Option_handler handler;
      std::string_view description;
   };

   auto find_option_handler(std::string_view name) noexcept -> Option_handler*;

   std::vector<Option> _options;

   Tool_mode _tool_mode = Tool_mode::interactive;
   std::string _source_file;
   std::string _chunk_directory;
   bool _verbose = false;
   bool _show_help = false;
};
