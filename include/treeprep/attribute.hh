#pragma once

#include <cstddef>
#include <filesystem>
#include <system_error>

#include "act_t.hh"
#include "audit_log.hh"

namespace treeprep {

inline namespace detail_v1 {

// access to the filesystem-level hidden marker
class attr_backend_t {
 public:
  virtual ~attr_backend_t() = default;

  // filesystems without a hidden marker report false
  virtual bool is_hidden(const std::filesystem::path &path,
                         std::error_code &ec) = 0;
  virtual void clear_hidden(const std::filesystem::path &path,
                            std::error_code &ec) = 0;
};

/**
 * @brief hidden marker of FAT family mounts (ATTR_HIDDEN via ioctl) and
 * NTFS-3G mounts (FILE_ATTRIBUTE_HIDDEN in system.ntfs_attrib_be)
 */
class native_attr_backend_t : public attr_backend_t {
 public:
  bool is_hidden(const std::filesystem::path &path,
                 std::error_code &ec) override;
  void clear_hidden(const std::filesystem::path &path,
                    std::error_code &ec) override;
};

/**
 * @brief clear the hidden marker on every entry under root
 *
 * @param root source root
 * @param backend attribute access
 * @param log audit log
 * @param act log only or apply
 * @return number of entries cleared
 */
std::size_t normalize_attributes(const std::filesystem::path &root,
                                 attr_backend_t &backend, audit_log_t &log,
                                 const act_t act);

}  // namespace detail_v1

}  // namespace treeprep
