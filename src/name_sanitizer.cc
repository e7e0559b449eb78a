#include "treeprep/name_sanitizer.hh"

#include <algorithm>
#include <set>
#include <system_error>

#include "treeprep/config.hh"
#include "treeprep/entry.hh"
#include "treeprep/fault.hh"
#include "treeprep/fs_ops.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

inline bool is_reserved(char c) noexcept {
  return reserved_chars.find(c) != std::string_view::npos;
}

}  // namespace

bool has_reserved(std::string_view name) noexcept {
  return std::any_of(name.begin(), name.end(), is_reserved);
}

std::string sanitize_name(std::string_view name) {
  std::string out(name);
  std::replace_if(out.begin(), out.end(), is_reserved, placeholder);
  return out;
}

std::size_t sanitize_names(const fs::path &root, audit_log_t &log,
                           const act_t act) {
  auto entries = ls_tree(root, log);
  sort_bottom_up(entries);

  std::size_t renamed = 0;
  // names taken by earlier would-be renames, report mode only
  std::set<fs::path> planned;
  for (const auto &entry : entries) {
    const auto name = entry.path().filename().native();
    if (!has_reserved(name)) {
      continue;
    }
    const auto new_name = sanitize_name(name);
    if (act == act_t::apply) {
      std::error_code ec;
      if (!rename_entry(entry.path(), new_name, ec)) {
        if (ec == fault_t::name_collision) {
          log.record(action_t::name_collision, entry.path(), new_name);
        } else {
          log.record(action_t::rename_failed, entry.path(), ec);
        }
        continue;
      }
    } else {
      auto target = entry.path().parent_path() / new_name;
      if (entry_exists(target) || !planned.insert(std::move(target)).second) {
        log.record(action_t::name_collision, entry.path(), new_name);
        continue;
      }
    }
    log.record(action_t::renamed, entry.path(), new_name);
    ++renamed;
  }
  return renamed;
}

}  // namespace detail_v1

}  // namespace treeprep
