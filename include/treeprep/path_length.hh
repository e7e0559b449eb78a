#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "act_t.hh"
#include "audit_log.hh"
#include "config.hh"

namespace treeprep {

inline namespace detail_v1 {

// length of a path in UTF-16 code units
std::size_t path_units(const std::filesystem::path &path);

/**
 * @brief shorten a name to at most budget units as
 * head + '~' + 8 hex digit tag + last tail_units of the name.
 * the tag is derived from the whole original name.
 *
 * @param name original name
 * @param budget units available for the name
 * @return shortened name, std::nullopt if even an empty head does not fit
 */
std::optional<std::string> shorten_name(std::string_view name,
                                        std::size_t budget);

/**
 * @brief rename entries whose absolute path exceeds max_path units.
 * the tree is walked top-down and each directory is listed only after it
 * got its final name, so every length is measured on the current path.
 * shortened directory names are capped at max_dir_units.
 *
 * @param root source root
 * @param max_path maximum path length
 * @param log audit log
 * @param act log only or apply
 * @return number of entries renamed
 */
std::size_t normalize_path_length(const std::filesystem::path &root,
                                  const std::size_t max_path, audit_log_t &log,
                                  const act_t act);

}  // namespace detail_v1

}  // namespace treeprep
