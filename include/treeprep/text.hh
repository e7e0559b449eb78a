#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace treeprep {

inline namespace detail_v1 {

// ASCII-only case folding, non-ASCII bytes pass through
std::string to_lower(std::string_view str);

bool ends_with_ci(std::string_view str, std::string_view suffix) noexcept;
bool starts_with_ci(std::string_view str, std::string_view prefix) noexcept;

// one UTF-8 sequence of a name
struct code_point_t {
  std::size_t offset;
  std::size_t length;  // bytes
  std::size_t units;   // UTF-16 code units
};

/**
 * @brief split UTF-8 text into code points,
 * a malformed byte becomes a code point of one byte and one unit.
 */
std::vector<code_point_t> split_code_points(std::string_view str);

/**
 * @brief length of UTF-8 text in UTF-16 code units,
 * the unit the destination counts path length in.
 */
std::size_t utf16_units(std::string_view str);

}  // namespace detail_v1

}  // namespace treeprep
