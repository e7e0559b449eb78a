#pragma once

#include <cstddef>
#include <filesystem>

#include "act_t.hh"
#include "audit_log.hh"
#include "content_hasher.hh"

namespace treeprep {

inline namespace detail_v1 {

/**
 * @brief remove files whose content equals an earlier file.
 * files are visited in lexicographic path order and the first file of each
 * content wins. Paths compare component by component (std::filesystem::path
 * ordering), so "a/f" precedes "a-x/f" even though '-' sorts before '/'
 * as a character. only files sharing their byte size with another file are
 * hashed. files that cannot be hashed are recorded and kept.
 *
 * @param root source root
 * @param hasher content hasher
 * @param log audit log
 * @param act log only or apply
 * @return number of duplicates removed
 */
std::size_t dedupe(const std::filesystem::path &root, content_hasher_t &hasher,
                   audit_log_t &log, const act_t act);

}  // namespace detail_v1

}  // namespace treeprep
