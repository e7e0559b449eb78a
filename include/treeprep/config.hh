#pragma once

#include <cstddef>
#include <string_view>

#define TREEPREP_EXPORT __attribute__((visibility("default")))

namespace treeprep {

// 1MiB
constexpr auto buf_sz = 1024UL * 1024UL;

constexpr auto default_hash_algo = "sha256";

// destination limit, in UTF-16 code units of the full path
constexpr std::size_t default_max_path = 260;

// trailing fragment kept when a name is shortened
constexpr std::size_t tail_units = 16;
constexpr char trunc_marker = '~';
constexpr std::size_t tag_digits = 8;
// a shortened directory leaves room for its descendants
constexpr std::size_t max_dir_units = 48;

constexpr char placeholder = '_';
constexpr std::string_view reserved_chars = "*:\"<>?|/\\";

}  // namespace treeprep
