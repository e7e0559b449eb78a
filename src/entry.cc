#include "treeprep/entry.hh"

#include <algorithm>
#include <iostream>
#include <system_error>

#include "treeprep/fs_ops.hh"
#include "treeprep/oss.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

void sort_lexical(std::vector<entry_t> &entries) {
  std::sort(entries.begin(), entries.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.path() < rhs.path(); });
}

void ls_dir_rec(const fs::path &dir, std::size_t depth,
                std::vector<entry_t> &entries, audit_log_t &log) {
  for (auto &entry : ls_dir(dir, depth, log)) {
    const bool recurse = entry.is_dir();
    const auto path = entry.path();
    entries.emplace_back(std::move(entry));
    if (recurse) {
      ls_dir_rec(path, depth + 1, entries, log);
    }
  }
}

}  // namespace

std::vector<entry_t> ls_dir(const fs::path &dir, std::size_t depth,
                            audit_log_t &log) {
  std::vector<entry_t> entries;
  std::error_code ec;
  for (const auto &child : read_dir(dir, ec)) {
    auto path = dir / child.name;
    if (child.ec) {
      // entry vanished or unreadable, skip
      log.record(action_t::skipped, path, child.ec);

    } else if (log.is_log_file(child.dev, child.ino)) {
      // the audit log itself

    } else if (child.is_symlink()) {
      // symlink, skip
      oss(std::cerr, level_t::warn) << "skip symlink: " << path << '\n';

    } else if (child.is_dir()) {
      entries.emplace_back(std::move(path), 0, kind_t::directory, depth);

    } else if (child.is_reg()) {
      entries.emplace_back(std::move(path), child.size, kind_t::file, depth);

    } else {
      // other file type, skip
      oss(std::cerr, level_t::warn) << "skip unsupport file: " << path << '\n';
    }
  }
  if (ec) {
    // error reading directory, keep what was read
    log.record(action_t::skipped, dir, ec);
  }
  sort_lexical(entries);
  return entries;
}

std::vector<entry_t> ls_tree(const fs::path &root, audit_log_t &log) {
  std::vector<entry_t> entries;
  ls_dir_rec(root, 1, entries, log);
  return entries;
}

void sort_bottom_up(std::vector<entry_t> &entries) {
  std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.depth() != rhs.depth()) {
      return lhs.depth() > rhs.depth();
    }
    return lhs.path() < rhs.path();
  });
}

}  // namespace detail_v1

}  // namespace treeprep
