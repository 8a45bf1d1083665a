#pragma once

#include <fmt/format.h>

#include <iostream>
#include <ostream>
#include <string_view>
#include <utility>

namespace console {

namespace detail {
inline std::ostream*& log_stream() noexcept
{
   static std::ostream* stream = &std::cout;

   return stream;
}

template<typename... Args>
inline void write_line(std::string_view tag, fmt::format_string<Args...> format,
                       Args&&... args)
{
   auto& out = *log_stream();

   out << tag << fmt::format(format, std::forward<Args>(args)...) << '\n';
}
}

// Returns the previously used stream.
inline auto redirect(std::ostream& stream) noexcept -> std::ostream&
{
   auto& previous = *detail::log_stream();

   detail::log_stream() = &stream;

   return previous;
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
   detail::write_line("Info: ", format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warning(fmt::format_string<Args...> format, Args&&... args)
{
   detail::write_line("Warning: ", format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
   detail::write_line("Error: ", format, std::forward<Args>(args)...);
}
}
