#pragma once

#include <cstddef>
#include <string>
#include <string_view>

inline constexpr std::string_view chunk_name_prefix{"chunk"};

inline constexpr std::string_view metadata_file_name{"info.json"};

inline constexpr std::string_view fallback_output_name{"reconstructed_file"};

// Indices past this no longer sort correctly by name.
inline constexpr std::size_t chunk_index_width = 3;
inline constexpr std::size_t max_ordered_chunk_count = 1000;

inline constexpr std::size_t default_chunk_size = 5 * 1024 * 1024;

auto chunk_file_name(const std::size_t index) -> std::string;

bool is_chunk_file_name(std::string_view name) noexcept;
