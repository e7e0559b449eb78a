#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "act_t.hh"
#include "audit_log.hh"

namespace treeprep {

inline namespace detail_v1 {

bool has_reserved(std::string_view name) noexcept;

// replace each reserved character with the placeholder, length is preserved
std::string sanitize_name(std::string_view name);

/**
 * @brief rename every entry whose name holds a reserved character.
 * entries are processed deepest first, so a directory is renamed only
 * after everything below it has its final name. an existing sibling
 * with the sanitized name is never overwritten (NameCollision).
 *
 * @param root source root
 * @param log audit log
 * @param act log only or apply
 * @return number of entries renamed
 */
std::size_t sanitize_names(const std::filesystem::path &root, audit_log_t &log,
                           const act_t act);

}  // namespace detail_v1

}  // namespace treeprep
