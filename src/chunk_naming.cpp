#include "chunk_naming.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

using namespace std::literals;

auto chunk_file_name(const std::size_t index) -> std::string
{
   return fmt::format("{}{:0{}}"sv, chunk_name_prefix, index, chunk_index_width);
}

bool is_chunk_file_name(std::string_view name) noexcept
{
   return begins_with(name, chunk_name_prefix);
}
