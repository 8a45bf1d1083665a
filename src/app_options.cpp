#include "app_options.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace {

std::stringstream create_arg_stream(int argc, char* argv[])
{
   std::stringstream arg_stream;

   for (auto i = 1; i < argc; ++i) {
      arg_stream << std::quoted(argv[i]) << ' ';
   }

   return arg_stream;
}

std::string read_file_path(std::istream& istream)
{
   std::string str;
   istream >> std::quoted(str);

   return str;
}

std::istream& operator>>(std::istream& istream, Tool_mode& mode)
{
   std::string str;
   istream >> std::quoted(str);

   if (str == "interactive"sv) {
      mode = Tool_mode::interactive;
   }
   else if (str == "split"sv) {
      mode = Tool_mode::split;
   }
   else if (str == "reconstruct"sv) {
      mode = Tool_mode::reconstruct;
   }
   else {
      throw std::invalid_argument{"Invalid tool mode specified."};
   }

   return istream;
}
}

constexpr auto mode_opt_description{
   R"(<mode> Set the mode of operation for the tool. Can be 'interactive', 'split' or 'reconstruct'.
   'interactive' (default) - Choose the operation and directories from a menu.
   'split' - Split the file given by -file into chunks inside the directory given by -dir.
   'reconstruct' - Rebuild the original file from the chunks inside the directory given by -dir.)"sv};

constexpr auto file_opt_description{
   R"(<filepath> Specify the file to split.)"sv};

constexpr auto dir_opt_description{
   R"(<directory> Specify the chunk directory. When splitting it is created if needed and must be empty.)"sv};

constexpr auto verbose_opt_description{R"(Enable verbose output.)"sv};

constexpr auto help_opt_description{R"(Print this help text.)"sv};

App_options::App_options()
{
   using Istr = std::istream;

   _options = {
      {"-mode"s, [this](Istr& istr) { istr >> _tool_mode; }, mode_opt_description},
      {"-file"s, [this](Istr& istr) { _source_file = read_file_path(istr); },
       file_opt_description},
      {"-dir"s, [this](Istr& istr) { _chunk_directory = read_file_path(istr); },
       dir_opt_description},
      {"-verbose"s, [this](Istr&) { _verbose = true; }, verbose_opt_description},
      {"-help"s, [this](Istr&) { _show_help = true; }, help_opt_description}};
}

App_options::App_options(const int argc, char* argv[]) : App_options()
{
   auto arg_stream = create_arg_stream(argc, argv);

   while (arg_stream) {
      std::string arg;
      arg_stream >> std::quoted(arg);

      const auto handler = find_option_handler(arg);

      if (handler) (*handler)(arg_stream);
   }
}

Tool_mode App_options::tool_mode() const noexcept
{
   return _tool_mode;
}

auto App_options::source_file() const noexcept -> const std::string&
{
   return _source_file;
}

auto App_options::chunk_directory() const noexcept -> const std::string&
{
   return _chunk_directory;
}

bool App_options::verbose() const noexcept
{
   return _verbose;
}

bool App_options::show_help() const noexcept
{
   return _show_help;
}

void App_options::print_arguments(std::ostream& ostream) const
{
   ostream << '\n';

   for (const auto& option : _options) {
      ostream << ' ' << option.name << ' ';
      ostream.write(option.description.data(), option.description.length());
      ostream << '\n';
   }

   ostream << '\n';
}

auto App_options::find_option_handler(std::string_view name) noexcept
   -> App_options::Option_handler*
{
   const auto result =
      std::find_if(std::begin(_options), std::end(_options),
                   [name](const Option& option) { return (option.name == name); });

   if (result == std::end(_options)) return nullptr;

   return &result->handler;
}
