#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace treeprep {

inline namespace detail_v1 {

enum class action_t {
  attribute_cleared,
  renamed,
  truncated,
  empty_removed,
  archive_removed,
  duplicate_removed,
  unsupported_removed,
  vendor_removed,
  skipped,
  // failures
  unreadable_file,
  rename_failed,
  removal_failed,
  name_collision,
  path_still_too_long,
  attribute_failed
};

std::string_view verb(action_t action) noexcept;

inline bool is_failure(action_t action) noexcept {
  return action >= action_t::unreadable_file;
}

/**
 * @brief append-only audit sink shared by every pass, thread-safe.
 * One line per record: VERB<TAB>path[<TAB>detail]
 */
class audit_log_t {
  std::ofstream _file;
  std::ostream *_os;
  std::atomic<std::size_t> _records{0};
  std::atomic<std::size_t> _failures{0};
  // identity of the log file, so a log inside a source root is left alone
  bool _has_id = false;
  uint64_t _dev = 0;
  uint64_t _ino = 0;

 public:
  /**
   * @brief create or truncate the log file
   * @throws std::runtime_error if the file cannot be opened
   */
  explicit audit_log_t(const std::filesystem::path &log_path);
  explicit audit_log_t(std::ostream &os) noexcept : _os(&os) {}
  ~audit_log_t();

  audit_log_t(const audit_log_t &) = delete;
  audit_log_t(audit_log_t &&) = delete;
  audit_log_t &operator=(const audit_log_t &) = delete;
  audit_log_t &operator=(audit_log_t &&) = delete;

  void record(action_t action, const std::filesystem::path &subject,
              std::string_view detail = {});
  void record(action_t action, const std::filesystem::path &subject,
              const std::error_code &ec);
  void flush();

  // true if dev/ino name the log file itself
  bool is_log_file(uint64_t dev, uint64_t ino) const noexcept {
    return _has_id && dev == _dev && ino == _ino;
  }

  std::size_t records() const noexcept { return _records; }
  std::size_t failures() const noexcept { return _failures; }
};

}  // namespace detail_v1

}  // namespace treeprep
