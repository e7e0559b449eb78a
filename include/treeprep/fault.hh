#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace treeprep {

inline namespace detail_v1 {

// per-entry failures, carried as std::error_code
enum class fault_t {
  path_invalid = 1,
  unreadable_file,
  rename_failed,
  removal_failed,
  name_collision,
  path_still_too_long,
  attribute_failed
};

const std::error_category &fault_category() noexcept;

inline std::error_code make_error_code(fault_t fault) noexcept {
  return {static_cast<int>(fault), fault_category()};
}

// source root missing or not a directory, fatal to the whole run
class path_invalid_error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  path_invalid_error(const std::filesystem::path &path, const std::string &why)
      : std::runtime_error("invalid source root: " + path.string() + " - " +
                           why),
        _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

}  // namespace detail_v1

}  // namespace treeprep

namespace std {

template <>
struct is_error_code_enum<treeprep::fault_t> : true_type {};

}  // namespace std
