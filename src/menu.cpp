#include "menu.hpp"
#include "string_helpers.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <istream>
#include <ostream>

using namespace std::literals;

namespace {

auto entry_style(const Entry_kind kind) noexcept -> std::optional<fmt::text_style>
{
   switch (kind) {
   case Entry_kind::directory:
      return std::nullopt;
   case Entry_kind::chunk_set:
      return fmt::fg(fmt::terminal_color::bright_green);
   case Entry_kind::action:
      return fmt::fg(fmt::terminal_color::bright_blue);
   case Entry_kind::exit:
      return fmt::fg(fmt::terminal_color::bright_red);
   }

   return std::nullopt;
}
}

auto format_menu_entry(const std::size_t number, const Menu_entry& entry) -> std::string
{
   const auto style = entry_style(entry.kind);

   if (!style) return fmt::format("{}. {}"sv, number, entry.label);

   return fmt::format(*style, "{}. {}"sv, number, entry.label);
}

void print_menu(std::string_view title, const std::vector<Menu_entry>& entries,
                std::ostream& out)
{
   if (!title.empty()) out << title << '\n';

   for (std::size_t i = 0; i < entries.size(); ++i) {
      out << format_menu_entry(i + 1, entries[i]) << '\n';
   }
}

auto prompt_menu(std::string_view title, const std::vector<Menu_entry>& entries,
                 std::istream& in, std::ostream& out) -> std::optional<std::size_t>
{
   while (true) {
      print_menu(title, entries, out);

      out << "Enter the number of your choice: "sv << std::flush;

      std::string line;

      if (!std::getline(in, line)) {
         out << '\n';

         return std::nullopt;
      }

      const auto number = parse_unsigned(trim_whitespace(line));

      if (number && *number > 0 && *number <= entries.size()) return *number - 1;

      out << "Invalid choice. Please select a valid number from the list.\n"sv;
   }
}
