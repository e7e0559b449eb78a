#pragma once

#include <sys/stat.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace treeprep {

inline namespace detail_v1 {

// RAII wrapper for a POSIX file descriptor.
class fd_t {
  int _fd = -1;

 public:
  fd_t() noexcept = default;
  explicit fd_t(int fd) noexcept : _fd(fd) {}
  ~fd_t() noexcept { reset(); }

  fd_t(const fd_t &) = delete;
  fd_t &operator=(const fd_t &) = delete;
  fd_t(fd_t &&rhs) noexcept : _fd(std::exchange(rhs._fd, -1)) {}
  fd_t &operator=(fd_t &&rhs) noexcept {
    if (this != &rhs) {
      reset();
      _fd = std::exchange(rhs._fd, -1);
    }
    return *this;
  }

  void reset() noexcept;
  int release() noexcept { return std::exchange(_fd, -1); }
  int get() const noexcept { return _fd; }
  explicit operator bool() const noexcept { return _fd >= 0; }
};

/**
 * @brief open a path, walking it one component at a time with openat(2)
 * when the literal path is too long for a single system call.
 *
 * @param path file or directory to open
 * @param flags open(2) flags, O_CLOEXEC is always added
 * @param[out] ec set on failure
 */
fd_t open_long(const std::filesystem::path &path, int flags,
               std::error_code &ec) noexcept;

// one directory child as fstatat(2) sees it, symlinks not followed
struct dir_child_t {
  std::string name;
  mode_t mode = 0;
  uint64_t size = 0;
  uint64_t dev = 0;
  uint64_t ino = 0;
  // stat failed, only name is valid
  std::error_code ec;

  bool is_dir() const noexcept { return S_ISDIR(mode); }
  bool is_reg() const noexcept { return S_ISREG(mode); }
  bool is_symlink() const noexcept { return S_ISLNK(mode); }
};

/**
 * @brief read every child of a directory, "." and ".." excluded, in
 * directory order. Long paths are opened through open_long.
 *
 * @param dir directory to read
 * @param[out] ec set if the directory cannot be opened or read; children
 * read before a read error are still returned
 */
std::vector<dir_child_t> read_dir(const std::filesystem::path &dir,
                                  std::error_code &ec);

// entry exists, symlinks not followed (long paths supported)
bool entry_exists(const std::filesystem::path &path) noexcept;

/**
 * @brief remove a file or an empty directory (long paths supported)
 * @return true if removed
 */
bool remove_entry(const std::filesystem::path &path,
                  std::error_code &ec) noexcept;

/**
 * @brief rename an entry within its directory, never replacing a sibling;
 * an existing target yields fault_t::name_collision.
 *
 * @param path entry to rename
 * @param new_name new final path component
 * @return true if renamed
 */
bool rename_entry(const std::filesystem::path &path,
                  const std::string &new_name, std::error_code &ec) noexcept;

}  // namespace detail_v1

}  // namespace treeprep
