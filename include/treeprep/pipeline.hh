#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "act_t.hh"
#include "attribute.hh"
#include "audit_log.hh"
#include "config.hh"
#include "prune.hh"

namespace treeprep {

inline namespace detail_v1 {

struct options_t {
  std::vector<std::filesystem::path> roots;
  std::filesystem::path log_path;
  std::size_t max_path = default_max_path;
  prune_rule_t unsupported = unsupported_rule();
  prune_rule_t vendor = vendor_rule();
  std::vector<std::string> archive_suffixes = default_archive_suffixes();
  std::string hash_algo = default_hash_algo;
  bool prune_empty_dirs = true;
  act_t act = act_t::apply;
  uint32_t max_thread = 4;
};

// mutations per pass
struct stats_t {
  std::size_t attributes_cleared = 0;
  std::size_t renamed = 0;
  std::size_t empty_removed = 0;
  std::size_t archives_removed = 0;
  std::size_t duplicates_removed = 0;
  std::size_t unsupported_removed = 0;
  std::size_t vendor_removed = 0;
  std::size_t truncated = 0;
  std::size_t failures = 0;

  std::size_t mutations() const noexcept {
    return attributes_cleared + renamed + empty_removed + archives_removed +
           duplicates_removed + unsupported_removed + vendor_removed +
           truncated;
  }
  stats_t &operator+=(const stats_t &rhs) noexcept;
};

/**
 * @brief run every pass, in order, over one root
 *
 * @param root source root, must be an existing directory
 * @param opt pipeline options
 * @param backend hidden attribute access
 * @param log audit log shared by all passes
 */
stats_t run_root(const std::filesystem::path &root, const options_t &opt,
                 attr_backend_t &backend, audit_log_t &log);

/**
 * @brief validate the roots, create or truncate the audit log, then process
 * each root as one job on a thread pool of opt.max_thread threads.
 *
 * Duplicate roots are processed once.
 *
 * @throws path_invalid_error if a root is not an accessible directory, or
 * lies inside another root
 * @throws std::runtime_error if the audit log cannot be opened
 * @throws std::invalid_argument if the hash algorithm is unknown
 */
stats_t run_pipeline(const options_t &opt, attr_backend_t &backend);
stats_t run_pipeline(const options_t &opt);

}  // namespace detail_v1

}  // namespace treeprep
