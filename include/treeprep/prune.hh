#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "act_t.hh"
#include "audit_log.hh"

namespace treeprep {

inline namespace detail_v1 {

/**
 * @brief disallowed file policy: extensions, exact names and name prefixes,
 * all matched case-insensitively. immutable once built.
 */
class prune_rule_t {
  action_t _action;
  std::vector<std::string> _exts;
  std::vector<std::string> _names;
  std::vector<std::string> _prefixes;

 public:
  /**
   * @param action verb recorded for each removal
   * @param exts extensions, with or without the leading dot
   * @param names exact file names
   * @param prefixes file name prefixes
   */
  prune_rule_t(action_t action, const std::vector<std::string> &exts,
               const std::vector<std::string> &names = {},
               const std::vector<std::string> &prefixes = {});

  bool matches(std::string_view file_name) const;
  action_t action() const noexcept { return _action; }
  const std::vector<std::string> &extensions() const noexcept { return _exts; }
};

// file types the destination refuses, plus office lock files
prune_rule_t unsupported_rule(const std::vector<std::string> &extra_exts = {});

// QuickBooks desktop company and working files
prune_rule_t vendor_rule(const std::vector<std::string> &extra_exts = {});

// archive suffixes recognized by prune_archives
std::vector<std::string> default_archive_suffixes();

/**
 * @brief remove zero-byte files, then (optionally) directories emptied by
 * those removals, deepest first. directories that were already empty and
 * the root are kept.
 *
 * @return number of entries removed
 */
std::size_t prune_empty(const std::filesystem::path &root, const bool prune_dirs,
                        audit_log_t &log, const act_t act);

/**
 * @brief remove an archive when an entry exists at its path with the archive
 * suffix stripped (report.zip next to report). the archive content is not
 * inspected.
 *
 * @param suffixes recognized suffixes, longest match wins
 * @return number of archives removed
 */
std::size_t prune_archives(const std::filesystem::path &root,
                           const std::vector<std::string> &suffixes,
                           audit_log_t &log, const act_t act);

/**
 * @brief remove every file matched by the rule
 * @return number of files removed
 */
std::size_t prune_by_rule(const std::filesystem::path &root,
                          const prune_rule_t &rule, audit_log_t &log,
                          const act_t act);

}  // namespace detail_v1

}  // namespace treeprep
