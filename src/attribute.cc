#include "treeprep/attribute.hh"

#include <fcntl.h>
#include <linux/msdos_fs.h>
#include <sys/ioctl.h>
#include <sys/xattr.h>

#include <array>
#include <cerrno>
#include <cstdint>

#include "treeprep/entry.hh"
#include "treeprep/fs_ops.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

constexpr auto ntfs_attrib_xattr = "system.ntfs_attrib_be";
constexpr uint32_t file_attribute_hidden = 0x2;

// errno meaning "this filesystem has no such attribute"
inline bool unsupported(int err) noexcept {
  return err == ENOTTY || err == EINVAL || err == ENOTSUP || err == ENODATA ||
         err == EOPNOTSUPP;
}

inline uint32_t load_be32(const std::array<unsigned char, 4> &buf) noexcept {
  return (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16) |
         (uint32_t(buf[2]) << 8) | uint32_t(buf[3]);
}

inline std::array<unsigned char, 4> store_be32(uint32_t val) noexcept {
  return {static_cast<unsigned char>(val >> 24),
          static_cast<unsigned char>(val >> 16),
          static_cast<unsigned char>(val >> 8),
          static_cast<unsigned char>(val)};
}

enum class attr_src_t { none, fat, ntfs };

// read raw attribute word, src tells which mechanism answered
uint32_t read_attrs(int fd, attr_src_t &src, std::error_code &ec) noexcept {
  uint32_t attrs = 0;
  if (::ioctl(fd, FAT_IOCTL_GET_ATTRIBUTES, &attrs) == 0) {
    src = attr_src_t::fat;
    return attrs;
  }
  if (!unsupported(errno)) {
    ec = {errno, std::system_category()};
    return 0;
  }
  std::array<unsigned char, 4> buf{};
  const auto len = ::fgetxattr(fd, ntfs_attrib_xattr, buf.data(), buf.size());
  if (len == static_cast<ssize_t>(buf.size())) {
    src = attr_src_t::ntfs;
    return load_be32(buf);
  }
  if (len < 0 && !unsupported(errno) && errno != ERANGE) {
    ec = {errno, std::system_category()};
    return 0;
  }
  src = attr_src_t::none;
  return 0;
}

}  // namespace

bool native_attr_backend_t::is_hidden(const fs::path &path,
                                      std::error_code &ec) {
  ec.clear();
  auto fd = open_long(path, O_RDONLY | O_NONBLOCK | O_NOFOLLOW, ec);
  if (!fd) {
    return false;
  }
  attr_src_t src = attr_src_t::none;
  const auto attrs = read_attrs(fd.get(), src, ec);
  switch (src) {
    case attr_src_t::fat:
      return (attrs & ATTR_HIDDEN) != 0;
    case attr_src_t::ntfs:
      return (attrs & file_attribute_hidden) != 0;
    case attr_src_t::none:
      break;
  }
  return false;
}

void native_attr_backend_t::clear_hidden(const fs::path &path,
                                         std::error_code &ec) {
  ec.clear();
  auto fd = open_long(path, O_RDONLY | O_NONBLOCK | O_NOFOLLOW, ec);
  if (!fd) {
    return;
  }
  attr_src_t src = attr_src_t::none;
  auto attrs = read_attrs(fd.get(), src, ec);
  if (ec) {
    return;
  }
  switch (src) {
    case attr_src_t::fat:
      attrs &= ~static_cast<uint32_t>(ATTR_HIDDEN);
      if (::ioctl(fd.get(), FAT_IOCTL_SET_ATTRIBUTES, &attrs) != 0) {
        ec = {errno, std::system_category()};
      }
      break;
    case attr_src_t::ntfs: {
      const auto buf = store_be32(attrs & ~file_attribute_hidden);
      if (::fsetxattr(fd.get(), ntfs_attrib_xattr, buf.data(), buf.size(), 0) !=
          0) {
        ec = {errno, std::system_category()};
      }
    } break;
    case attr_src_t::none:
      break;
  }
}

std::size_t normalize_attributes(const fs::path &root, attr_backend_t &backend,
                                 audit_log_t &log, const act_t act) {
  std::size_t cleared = 0;
  for (const auto &entry : ls_tree(root, log)) {
    std::error_code ec;
    if (!backend.is_hidden(entry.path(), ec)) {
      if (ec) {
        log.record(action_t::attribute_failed, entry.path(), ec);
      }
      continue;
    }
    if (act == act_t::apply) {
      backend.clear_hidden(entry.path(), ec);
      if (ec) {
        log.record(action_t::attribute_failed, entry.path(), ec);
        continue;
      }
    }
    log.record(action_t::attribute_cleared, entry.path());
    ++cleared;
  }
  return cleared;
}

}  // namespace detail_v1

}  // namespace treeprep
