#include "treeprep/text.hh"

#include <algorithm>

namespace treeprep {

inline namespace detail_v1 {

namespace {

inline char lower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool is_cont(unsigned char c) noexcept { return (c & 0xC0U) == 0x80U; }

// length of a well-formed sequence starting at str[i], 0 if malformed
std::size_t seq_len(std::string_view str, std::size_t i) noexcept {
  const auto lead = static_cast<unsigned char>(str[i]);
  std::size_t len = 0;
  if (lead < 0x80U) {
    return 1;
  } else if ((lead & 0xE0U) == 0xC0U && lead >= 0xC2U) {
    len = 2;
  } else if ((lead & 0xF0U) == 0xE0U) {
    len = 3;
  } else if ((lead & 0xF8U) == 0xF0U && lead <= 0xF4U) {
    len = 4;
  } else {
    return 0;
  }
  if (i + len > str.size()) {
    return 0;
  }
  for (auto j = 1UL; j < len; ++j) {
    if (!is_cont(static_cast<unsigned char>(str[i + j]))) {
      return 0;
    }
  }
  return len;
}

}  // namespace

std::string to_lower(std::string_view str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(), lower_ascii);
  return out;
}

bool ends_with_ci(std::string_view str, std::string_view suffix) noexcept {
  if (suffix.size() > str.size()) {
    return false;
  }
  return std::equal(suffix.begin(), suffix.end(), str.end() - suffix.size(),
                    [](char a, char b) { return lower_ascii(a) == lower_ascii(b); });
}

bool starts_with_ci(std::string_view str, std::string_view prefix) noexcept {
  if (prefix.size() > str.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), str.begin(),
                    [](char a, char b) { return lower_ascii(a) == lower_ascii(b); });
}

std::vector<code_point_t> split_code_points(std::string_view str) {
  std::vector<code_point_t> cps;
  cps.reserve(str.size());
  for (std::size_t i = 0; i < str.size();) {
    auto len = seq_len(str, i);
    if (len == 0) {
      cps.push_back({i, 1, 1});
      ++i;
      continue;
    }
    // outside the BMP takes a surrogate pair
    cps.push_back({i, len, len == 4 ? 2UL : 1UL});
    i += len;
  }
  return cps;
}

std::size_t utf16_units(std::string_view str) {
  std::size_t units = 0;
  for (const auto &cp : split_code_points(str)) {
    units += cp.units;
  }
  return units;
}

}  // namespace detail_v1

}  // namespace treeprep
