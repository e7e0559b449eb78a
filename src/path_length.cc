#include "treeprep/path_length.hh"

#include <xxhash.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <system_error>

#include "treeprep/entry.hh"
#include "treeprep/fault.hh"
#include "treeprep/fs_ops.hh"
#include "treeprep/text.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

std::string name_tag(std::string_view name) {
  const auto hash = XXH3_64bits(name.data(), name.size());
  char buf[tag_digits + 2];
  std::snprintf(buf, sizeof(buf), "%c%08x", trunc_marker,
                static_cast<unsigned>(hash & 0xFFFFFFFFULL));
  return buf;
}

class length_walker_t {
  std::size_t _max_path;
  audit_log_t &_log;
  act_t _act;
  std::size_t _renamed = 0;

  // phys is where the directory is on disk, logical where it would be
  void walk(const fs::path &phys, const fs::path &logical, std::size_t depth) {
    const auto parent_units = path_units(logical);
    for (const auto &child : ls_dir(phys, depth, _log)) {
      const auto name = child.path().filename().native();
      auto child_phys = child.path();
      auto child_logical = logical / name;
      const auto units = parent_units + 1 + utf16_units(name);
      if (units > _max_path) {
        auto budget =
            _max_path > parent_units + 1 ? _max_path - parent_units - 1 : 0;
        if (child.is_dir()) {
          budget = std::min(budget, max_dir_units);
        }
        auto short_name = shorten_name(name, budget);
        if (!short_name) {
          _log.record(action_t::path_still_too_long, child.path(),
                      std::to_string(units) + " > " + std::to_string(_max_path));
        } else if (rename(child, *short_name)) {
          child_phys = _act == act_t::apply
                           ? child.path().parent_path() / *short_name
                           : child.path();
          child_logical = logical / *short_name;
        }
      }
      if (child.is_dir()) {
        walk(child_phys, child_logical, depth + 1);
      }
    }
  }

  bool rename(const entry_t &child, const std::string &short_name) {
    if (_act == act_t::apply) {
      std::error_code ec;
      if (!rename_entry(child.path(), short_name, ec)) {
        if (ec == fault_t::name_collision) {
          _log.record(action_t::name_collision, child.path(), short_name);
        } else {
          _log.record(action_t::rename_failed, child.path(), ec);
        }
        return false;
      }
    }
    _log.record(action_t::truncated, child.path(), short_name);
    ++_renamed;
    return true;
  }

 public:
  length_walker_t(std::size_t max_path, audit_log_t &log, act_t act)
      : _max_path(max_path), _log(log), _act(act) {}

  std::size_t run(const fs::path &root) {
    auto logical = fs::absolute(root).lexically_normal();
    if (!logical.has_filename() && logical.has_parent_path() &&
        logical != logical.root_path()) {
      logical = logical.parent_path();
    }
    walk(root, logical, 1);
    return _renamed;
  }
};

}  // namespace

std::size_t path_units(const fs::path &path) {
  return utf16_units(path.native());
}

std::optional<std::string> shorten_name(std::string_view name,
                                        std::size_t budget) {
  const auto cps = split_code_points(name);

  // trailing fragment, whole code points only
  std::size_t tail_start = cps.size();
  std::size_t tail_len = 0;
  while (tail_start > 0 && tail_len + cps[tail_start - 1].units <= tail_units) {
    --tail_start;
    tail_len += cps[tail_start].units;
  }

  const auto tag = name_tag(name);
  const auto fixed = tag.size() + tail_len;
  if (fixed > budget) {
    return std::nullopt;
  }

  std::size_t head_end = 0;
  std::size_t head_len = 0;
  while (head_end < tail_start && head_len + cps[head_end].units <= budget - fixed) {
    head_len += cps[head_end].units;
    ++head_end;
  }

  const auto head_bytes = head_end == 0 ? 0 : cps[head_end - 1].offset + cps[head_end - 1].length;
  const auto tail_offset = tail_start == cps.size() ? name.size() : cps[tail_start].offset;
  std::string out;
  out.reserve(head_bytes + tag.size() + (name.size() - tail_offset));
  out.append(name.substr(0, head_bytes));
  out.append(tag);
  out.append(name.substr(tail_offset));
  return out;
}

std::size_t normalize_path_length(const fs::path &root, const std::size_t max_path,
                                  audit_log_t &log, const act_t act) {
  return length_walker_t(max_path, log, act).run(root);
}

}  // namespace detail_v1

}  // namespace treeprep
