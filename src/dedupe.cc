#include "treeprep/dedupe.hh"

#include <cstdint>
#include <map>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "treeprep/entry.hh"
#include "treeprep/fs_ops.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

std::size_t dedupe(const fs::path &root, content_hasher_t &hasher,
                   audit_log_t &log, const act_t act) {
  // ls_tree yields lexicographic order, which decides the kept copy
  std::vector<entry_t> file_list;
  for (auto &entry : ls_tree(root, log)) {
    if (!entry.is_dir()) {
      file_list.emplace_back(std::move(entry));
    }
  }

  // a file with a unique size cannot have a duplicate
  std::unordered_map<uint64_t, std::size_t> size_cnt;
  for (const auto &file : file_list) {
    ++size_cnt[file.size()];
  }

  std::map<digest_t, fs::path> seen;
  std::size_t dup_cnt = 0;
  for (const auto &file : file_list) {
    if (size_cnt[file.size()] < 2) {
      continue;
    }
    std::error_code ec;
    auto digest = hasher.hash(file.path(), ec);
    if (ec) {
      log.record(action_t::unreadable_file, file.path(), ec);
      continue;
    }
    auto [it, inserted] = seen.try_emplace(std::move(digest), file.path());
    if (inserted) {
      continue;
    }
    if (act == act_t::apply) {
      if (!remove_entry(file.path(), ec)) {
        log.record(action_t::removal_failed, file.path(), ec);
        continue;
      }
    }
    log.record(action_t::duplicate_removed, file.path(), it->second.native());
    ++dup_cnt;
  }
  return dup_cnt;
}

}  // namespace detail_v1

}  // namespace treeprep
