#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include "audit_log.hh"

namespace treeprep {

inline namespace detail_v1 {

enum class kind_t { file, directory };

class entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  kind_t _kind = kind_t::file;
  std::size_t _depth = 0;

 public:
  template <typename Tp>
  inline entry_t(Tp &&path, const uint64_t size, const kind_t kind,
                 const std::size_t depth)
      : _path(std::forward<Tp>(path)), _size(size), _kind(kind), _depth(depth) {}

  inline entry_t(const entry_t &rhs) = default;
  inline entry_t(entry_t &&rhs) = default;
  inline entry_t &operator=(const entry_t &rhs) = default;
  inline entry_t &operator=(entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline kind_t kind() const noexcept { return _kind; }
  inline bool is_dir() const noexcept { return _kind == kind_t::directory; }
  // 1 for direct children of the root
  inline std::size_t depth() const noexcept { return _depth; }
};

/**
 * @brief list directory recursively, the root itself is not listed.
 * symlinks and special files are skipped, unreadable directories are
 * recorded as Skipped in the audit log. The audit log's own file is never
 * listed. Directories beyond PATH_MAX are read through openat(2).
 *
 * @param root directory to list
 * @param log audit log
 * @return entries in lexicographic path order
 */
std::vector<entry_t> ls_tree(const std::filesystem::path &root,
                             audit_log_t &log);

/**
 * @brief list the direct children of one directory,
 * in lexicographic order, with the same skipping rules as ls_tree.
 */
std::vector<entry_t> ls_dir(const std::filesystem::path &dir,
                            std::size_t depth, audit_log_t &log);

// deepest first, lexicographic within a depth
void sort_bottom_up(std::vector<entry_t> &entries);

}  // namespace detail_v1

}  // namespace treeprep
