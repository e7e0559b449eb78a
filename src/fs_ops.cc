#include "treeprep/fs_ops.hh"

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <memory>
#include <string_view>

#include "treeprep/fault.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

inline std::error_code last_error() noexcept {
  return {errno, std::system_category()};
}

inline bool is_long(const fs::path &path) noexcept {
  return path.native().size() >= PATH_MAX;
}

// directory holding path, the returned fd is AT_FDCWD for short paths
fd_t open_parent(const fs::path &path, int &dirfd, std::error_code &ec) noexcept {
  if (!is_long(path)) {
    dirfd = AT_FDCWD;
    return {};
  }
  auto dir = open_long(path.parent_path(), O_RDONLY | O_DIRECTORY, ec);
  dirfd = dir.get();
  return dir;
}

// name relative to open_parent's fd
inline std::string at_name(const fs::path &path) {
  return is_long(path) ? path.filename().native() : path.native();
}

struct dir_closer_t {
  void operator()(DIR *dp) const noexcept { ::closedir(dp); }
};

}  // namespace

void fd_t::reset() noexcept {
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
}

fd_t open_long(const fs::path &path, int flags, std::error_code &ec) noexcept {
  ec.clear();
  flags |= O_CLOEXEC;
  if (!is_long(path)) {
    fd_t fd(::open(path.c_str(), flags));
    if (!fd) {
      ec = last_error();
    }
    return fd;
  }

  // extended addressing: descend relative to directory descriptors
  fd_t dir(::open(path.is_absolute() ? "/" : ".", O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (!dir) {
    ec = last_error();
    return {};
  }
  const auto rel = path.relative_path();
  auto last = rel.end();
  for (auto it = rel.begin(); it != rel.end(); ++it) {
    if (!it->empty()) {
      last = it;
    }
  }
  for (auto it = rel.begin(); it != rel.end(); ++it) {
    if (it->empty()) {
      continue;
    }
    if (it == last) {
      fd_t fd(::openat(dir.get(), it->c_str(), flags));
      if (!fd) {
        ec = last_error();
      }
      return fd;
    }
    fd_t next(::openat(dir.get(), it->c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!next) {
      ec = last_error();
      return {};
    }
    dir = std::move(next);
  }
  return dir;
}

std::vector<dir_child_t> read_dir(const fs::path &dir, std::error_code &ec) {
  std::vector<dir_child_t> children;
  auto fd = open_long(dir, O_RDONLY | O_DIRECTORY, ec);
  if (ec) {
    return children;
  }
  std::unique_ptr<DIR, dir_closer_t> dp(::fdopendir(fd.get()));
  if (!dp) {
    ec = last_error();
    return children;
  }
  // owned by dp now
  fd.release();

  for (;;) {
    errno = 0;
    const auto *ent = ::readdir(dp.get());
    if (ent == nullptr) {
      if (errno != 0) {
        ec = last_error();
      }
      break;
    }
    const std::string_view name(ent->d_name);
    if (name == "." || name == "..") {
      continue;
    }
    auto &child = children.emplace_back();
    child.name = name;
    struct stat st {};
    if (::fstatat(::dirfd(dp.get()), ent->d_name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
      child.ec = last_error();
      continue;
    }
    child.mode = st.st_mode;
    child.size = static_cast<uint64_t>(st.st_size);
    child.dev = static_cast<uint64_t>(st.st_dev);
    child.ino = static_cast<uint64_t>(st.st_ino);
  }
  return children;
}

bool entry_exists(const fs::path &path) noexcept {
  std::error_code ec;
  int dirfd = AT_FDCWD;
  auto parent = open_parent(path, dirfd, ec);
  if (ec) {
    return false;
  }
  const auto name = at_name(path);
  struct stat st {};
  return ::fstatat(dirfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0;
}

bool remove_entry(const fs::path &path, std::error_code &ec) noexcept {
  ec.clear();
  int dirfd = AT_FDCWD;
  auto parent = open_parent(path, dirfd, ec);
  if (ec) {
    return false;
  }
  const auto name = at_name(path);
  struct stat st {};
  if (::fstatat(dirfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
    ec = last_error();
    return false;
  }
  const int flag = S_ISDIR(st.st_mode) ? AT_REMOVEDIR : 0;
  if (::unlinkat(dirfd, name.c_str(), flag) != 0) {
    ec = last_error();
    return false;
  }
  return true;
}

bool rename_entry(const fs::path &path, const std::string &new_name,
                  std::error_code &ec) noexcept {
  ec.clear();
  int dirfd = AT_FDCWD;
  auto parent = open_parent(path, dirfd, ec);
  if (ec) {
    return false;
  }
  const auto from = at_name(path);
  const auto to = is_long(path) ? new_name
                                : (path.parent_path() / new_name).native();
  if (::renameat2(dirfd, from.c_str(), dirfd, to.c_str(), RENAME_NOREPLACE) == 0) {
    return true;
  }
  if (errno == EEXIST) {
    ec = fault_t::name_collision;
    return false;
  }
  if (errno != EINVAL && errno != ENOSYS) {
    ec = last_error();
    return false;
  }
  // filesystem without RENAME_NOREPLACE, check then rename
  struct stat st {};
  if (::fstatat(dirfd, to.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0) {
    ec = fault_t::name_collision;
    return false;
  }
  if (::renameat(dirfd, from.c_str(), dirfd, to.c_str()) != 0) {
    ec = last_error();
    return false;
  }
  return true;
}

}  // namespace detail_v1

}  // namespace treeprep
