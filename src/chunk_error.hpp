#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

enum class Chunk_errc { not_found, already_populated, io_failure };

class Chunk_error : public std::runtime_error {
public:
   Chunk_error(const Chunk_errc code, const std::string& message)
      : std::runtime_error{message}, _code{code}
   {
   }

   Chunk_errc code() const noexcept
   {
      return _code;
   }

private:
   Chunk_errc _code;
};

constexpr auto to_string_view(const Chunk_errc code) noexcept -> std::string_view
{
   using namespace std::literals;

   switch (code) {
   case Chunk_errc::not_found:
      return "not found"sv;
   case Chunk_errc::already_populated:
      return "already populated"sv;
   case Chunk_errc::io_failure:
      return "I/O failure"sv;
   }

   return "unknown"sv;
}
