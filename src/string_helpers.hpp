#pragma once

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool begins_with(
   std::basic_string_view<Char_t, Char_triats> string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   if (what.size() > string.size()) return false;

   return (string.substr(0, what.size()) == what);
}

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool begins_with(
   const std::basic_string<Char_t, Char_triats>& string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   return begins_with(std::basic_string_view<Char_t, Char_triats>{string}, what);
}

constexpr auto trim_whitespace(std::string_view string) noexcept -> std::string_view
{
   constexpr std::string_view whitespace{" \t\r\n\v\f"};

   const auto first = string.find_first_not_of(whitespace);

   if (first == string.npos) return {};

   const auto last = string.find_last_not_of(whitespace);

   return string.substr(first, last - first + 1);
}

// Whole string must be a decimal number with an optional leading '+'.
inline auto parse_unsigned(std::string_view string) noexcept -> std::optional<std::size_t>
{
   if (!string.empty() && string.front() == '+') string.remove_prefix(1);

   if (string.empty()) return std::nullopt;

   std::size_t value = 0;

   const auto [last, ec] =
      std::from_chars(string.data(), string.data() + string.size(), value);

   if (ec != std::errc{} || last != string.data() + string.size()) return std::nullopt;

   return value;
}
