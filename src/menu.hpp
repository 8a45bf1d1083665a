#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Entry_kind { directory, chunk_set, action, exit };

struct Menu_entry {
   std::string label;
   Entry_kind kind = Entry_kind::action;
};

auto format_menu_entry(const std::size_t number, const Menu_entry& entry) -> std::string;

void print_menu(std::string_view title, const std::vector<Menu_entry>& entries,
                std::ostream& out);

// Prompts until a valid entry number is entered and returns its zero-based index.
// Returns nullopt once the input is exhausted.
auto prompt_menu(std::string_view title, const std::vector<Menu_entry>& entries,
                 std::istream& in, std::ostream& out) -> std::optional<std::size_t>;
