#include "treeprep/prune.hh"

#include <algorithm>
#include <set>
#include <system_error>

#include "treeprep/entry.hh"
#include "treeprep/fs_ops.hh"
#include "treeprep/text.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

std::string normalize_ext(std::string_view ext) {
  auto out = to_lower(ext);
  if (!out.empty() && out.front() != '.') {
    out.insert(out.begin(), '.');
  }
  return out;
}

std::vector<std::string> merge_exts(std::vector<std::string> exts,
                                    const std::vector<std::string> &extra) {
  exts.insert(exts.end(), extra.begin(), extra.end());
  return exts;
}

// remove or pretend to, recording the outcome
bool remove_recorded(const fs::path &path, action_t action,
                     std::string_view detail, audit_log_t &log,
                     const act_t act) {
  if (act == act_t::apply) {
    std::error_code ec;
    if (!remove_entry(path, ec)) {
      log.record(action_t::removal_failed, path, ec);
      return false;
    }
  }
  log.record(action, path, detail);
  return true;
}

// no child left besides those removed by this pass, the audit log counts
// as a child
bool is_emptied(const fs::path &dir, const std::set<fs::path> &removed,
                const audit_log_t &log, std::error_code &ec) {
  for (const auto &child : read_dir(dir, ec)) {
    if (log.is_log_file(child.dev, child.ino) ||
        removed.count(dir / child.name) == 0) {
      return false;
    }
  }
  return !ec;
}

}  // namespace

prune_rule_t::prune_rule_t(action_t action, const std::vector<std::string> &exts,
                           const std::vector<std::string> &names,
                           const std::vector<std::string> &prefixes)
    : _action(action), _names(names), _prefixes(prefixes) {
  for (const auto &ext : exts) {
    auto norm = normalize_ext(ext);
    if (!norm.empty() && std::find(_exts.begin(), _exts.end(), norm) == _exts.end()) {
      _exts.emplace_back(std::move(norm));
    }
  }
}

bool prune_rule_t::matches(std::string_view file_name) const {
  for (const auto &ext : _exts) {
    if (ends_with_ci(file_name, ext)) {
      return true;
    }
  }
  for (const auto &name : _names) {
    if (file_name.size() == name.size() && starts_with_ci(file_name, name)) {
      return true;
    }
  }
  for (const auto &prefix : _prefixes) {
    if (starts_with_ci(file_name, prefix)) {
      return true;
    }
  }
  return false;
}

prune_rule_t unsupported_rule(const std::vector<std::string> &extra_exts) {
  return {action_t::unsupported_removed,
          merge_exts({".tmp", ".lnk", ".url", ".pst", ".ost", ".ashx", ".asmx",
                      ".soap", ".svc", ".xamlx"},
                     extra_exts),
          {"thumbs.db", "desktop.ini", ".ds_store"},
          {"~$"}};
}

prune_rule_t vendor_rule(const std::vector<std::string> &extra_exts) {
  return {action_t::vendor_removed,
          merge_exts({".qbw", ".qbb", ".qbm", ".qbx", ".qba", ".qby", ".tlg",
                      ".nd", ".dsn", ".ecml", ".lgb"},
                     extra_exts)};
}

std::vector<std::string> default_archive_suffixes() {
  return {".tar.gz", ".tar.bz2", ".tar.xz", ".tgz", ".zip", ".7z",
          ".rar",    ".tar",     ".gz",     ".bz2", ".xz"};
}

std::size_t prune_empty(const fs::path &root, const bool prune_dirs,
                        audit_log_t &log, const act_t act) {
  auto entries = ls_tree(root, log);
  std::set<fs::path> removed;
  // directories that lost a child, only these may become empty
  std::set<fs::path> touched;

  for (const auto &entry : entries) {
    if (entry.is_dir() || entry.size() != 0) {
      continue;
    }
    if (remove_recorded(entry.path(), action_t::empty_removed, {}, log, act)) {
      removed.insert(entry.path());
      touched.insert(entry.path().parent_path());
    }
  }

  if (prune_dirs) {
    sort_bottom_up(entries);
    for (const auto &entry : entries) {
      if (!entry.is_dir() || touched.count(entry.path()) == 0) {
        continue;
      }
      std::error_code ec;
      if (!is_emptied(entry.path(), removed, log, ec)) {
        if (ec) {
          log.record(action_t::skipped, entry.path(), ec);
        }
        continue;
      }
      if (remove_recorded(entry.path(), action_t::empty_removed, {}, log, act)) {
        removed.insert(entry.path());
        touched.insert(entry.path().parent_path());
      }
    }
  }
  return removed.size();
}

std::size_t prune_archives(const fs::path &root,
                           const std::vector<std::string> &suffixes,
                           audit_log_t &log, const act_t act) {
  std::size_t count = 0;
  for (const auto &entry : ls_tree(root, log)) {
    if (entry.is_dir()) {
      continue;
    }
    const auto name = entry.path().filename().native();
    std::size_t strip = 0;
    for (const auto &suffix : suffixes) {
      if (suffix.size() > strip && ends_with_ci(name, suffix)) {
        strip = suffix.size();
      }
    }
    // nothing matched, or the name is only a suffix
    if (strip == 0 || strip >= name.size()) {
      continue;
    }
    const auto expanded =
        entry.path().parent_path() / name.substr(0, name.size() - strip);
    if (!entry_exists(expanded)) {
      continue;
    }
    if (remove_recorded(entry.path(), action_t::archive_removed,
                        expanded.native(), log, act)) {
      ++count;
    }
  }
  return count;
}

std::size_t prune_by_rule(const fs::path &root, const prune_rule_t &rule,
                          audit_log_t &log, const act_t act) {
  std::size_t count = 0;
  for (const auto &entry : ls_tree(root, log)) {
    if (entry.is_dir() || !rule.matches(entry.path().filename().native())) {
      continue;
    }
    if (remove_recorded(entry.path(), rule.action(), {}, log, act)) {
      ++count;
    }
  }
  return count;
}

}  // namespace detail_v1

}  // namespace treeprep
