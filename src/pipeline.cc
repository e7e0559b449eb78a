#include "treeprep/pipeline.hh"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include "treeprep/content_hasher.hh"
#include "treeprep/dedupe.hh"
#include "treeprep/fault.hh"
#include "treeprep/name_sanitizer.hh"
#include "treeprep/oss.hh"
#include "treeprep/path_length.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace ba = boost::asio;

namespace {

// per-pass wall time of one root, reported on stderr
class pass_clock_t {
  const fs::path &_root;
  std::chrono::steady_clock::time_point _lap;

 public:
  explicit pass_clock_t(const fs::path &root) noexcept
      : _root(root), _lap(std::chrono::steady_clock::now()) {}

  std::size_t lap(const char *pass, const std::size_t count) {
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - _lap);
    _lap = now;
    oss(std::cerr, level_t::log) << _root << ": " << pass << ' ' << count
                                 << " in " << elapsed.count() << "ms\n";
    return count;
  }
};

// canonical, symlinks resolved, so overlapping roots can be spotted
fs::path normalize_root(const fs::path &root) {
  std::error_code ec;
  auto abs = fs::canonical(root, ec);
  if (ec) {
    throw path_invalid_error(root, ec.message());
  }
  if (!fs::is_directory(abs, ec)) {
    throw path_invalid_error(root, ec ? ec.message() : "not a directory");
  }
  fs::directory_iterator probe(abs, ec);
  if (ec) {
    throw path_invalid_error(root, ec.message());
  }
  return abs;
}

inline bool is_within(const fs::path &inner, const fs::path &outer) {
  return std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end())
             .first == outer.end();
}

// sorted, duplicates dropped, nested roots rejected
std::vector<fs::path> independent_roots(const std::vector<fs::path> &given) {
  std::vector<fs::path> roots;
  roots.reserve(given.size());
  for (const auto &root : given) {
    roots.emplace_back(normalize_root(root));
  }
  std::sort(roots.begin(), roots.end());
  auto last = std::unique(roots.begin(), roots.end());
  if (last != roots.end()) {
    oss(std::cerr, level_t::warn) << "duplicate source roots ignored\n";
    roots.erase(last, roots.end());
  }
  // a nested root sorts right after the root holding it
  for (std::size_t i = 1; i < roots.size(); ++i) {
    if (is_within(roots[i], roots[i - 1])) {
      throw path_invalid_error(roots[i],
                               "nested in source root " + roots[i - 1].string());
    }
  }
  return roots;
}

}  // namespace

stats_t &stats_t::operator+=(const stats_t &rhs) noexcept {
  attributes_cleared += rhs.attributes_cleared;
  renamed += rhs.renamed;
  empty_removed += rhs.empty_removed;
  archives_removed += rhs.archives_removed;
  duplicates_removed += rhs.duplicates_removed;
  unsupported_removed += rhs.unsupported_removed;
  vendor_removed += rhs.vendor_removed;
  truncated += rhs.truncated;
  failures += rhs.failures;
  return *this;
}

stats_t run_root(const fs::path &root, const options_t &opt,
                 attr_backend_t &backend, audit_log_t &log) {
  content_hasher_t hasher(opt.hash_algo);
  const auto failures_before = log.failures();
  stats_t stats;
  pass_clock_t clock(root);

  stats.attributes_cleared = clock.lap(
      "hidden attributes cleared:", normalize_attributes(root, backend, log, opt.act));
  stats.renamed = clock.lap("names sanitized:", sanitize_names(root, log, opt.act));
  stats.empty_removed = clock.lap(
      "empty items removed:", prune_empty(root, opt.prune_empty_dirs, log, opt.act));
  stats.archives_removed =
      clock.lap("duplicate archives removed:",
                prune_archives(root, opt.archive_suffixes, log, opt.act));
  stats.duplicates_removed =
      clock.lap("duplicate files removed:", dedupe(root, hasher, log, opt.act));
  stats.unsupported_removed = clock.lap(
      "unsupported files removed:", prune_by_rule(root, opt.unsupported, log, opt.act));
  stats.vendor_removed = clock.lap(
      "vendor files removed:", prune_by_rule(root, opt.vendor, log, opt.act));
  stats.truncated = clock.lap(
      "paths shortened:", normalize_path_length(root, opt.max_path, log, opt.act));

  // counts failures of concurrent roots too when the log is shared
  stats.failures = log.failures() - failures_before;
  return stats;
}

stats_t run_pipeline(const options_t &opt, attr_backend_t &backend) {
  if (opt.roots.empty()) {
    throw std::invalid_argument("no source root given");
  }
  if (opt.max_thread == 0) {
    throw std::invalid_argument("thread count must be > 0");
  }
  // fail early on a bad algorithm, before touching the log
  content_hasher_t probe(opt.hash_algo);
  oss(std::cerr, level_t::log) << "hash algorithm: " << probe.name() << '\n';

  const auto roots = independent_roots(opt.roots);

  audit_log_t log(opt.log_path);
  if (opt.act == act_t::log) {
    oss(std::cerr, level_t::log) << "dry run, the tree is not modified\n";
  }

  stats_t total;
  std::exception_ptr error;
  {
    ba::thread_pool pool(std::min<std::size_t>(opt.max_thread, roots.size()));
    std::mutex mtx;
    for (const auto &root : roots) {
      ba::post(pool, [&, root] {
        try {
          auto stats = run_root(root, opt, backend, log);
          std::lock_guard lk(mtx);
          total += stats;
        } catch (...) {
          std::lock_guard lk(mtx);
          if (!error) {
            error = std::current_exception();
          }
        }
      });
    }
    pool.join();
  }
  log.flush();
  total.failures = log.failures();
  if (error) {
    std::rethrow_exception(error);
  }

  oss(std::cerr, level_t::log) << "mutations: " << total.mutations()
                               << ", failures: " << total.failures << '\n';
  return total;
}

stats_t run_pipeline(const options_t &opt) {
  native_attr_backend_t backend;
  return run_pipeline(opt, backend);
}

}  // namespace detail_v1

}  // namespace treeprep
