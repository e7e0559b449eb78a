#include "treeprep/audit_log.hh"

#include <sys/stat.h>

#include <iostream>
#include <stdexcept>

#include "treeprep/oss.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

std::string_view verb(action_t action) noexcept {
  switch (action) {
    case action_t::attribute_cleared:
      return "AttributeCleared";
    case action_t::renamed:
      return "Renamed";
    case action_t::truncated:
      return "Truncated";
    case action_t::empty_removed:
      return "EmptyRemoved";
    case action_t::archive_removed:
      return "ArchiveRemoved";
    case action_t::duplicate_removed:
      return "DuplicateRemoved";
    case action_t::unsupported_removed:
      return "UnsupportedRemoved";
    case action_t::vendor_removed:
      return "VendorRemoved";
    case action_t::skipped:
      return "Skipped";
    case action_t::unreadable_file:
      return "UnreadableFile";
    case action_t::rename_failed:
      return "RenameFailed";
    case action_t::removal_failed:
      return "RemovalFailed";
    case action_t::name_collision:
      return "NameCollision";
    case action_t::path_still_too_long:
      return "PathStillTooLong";
    case action_t::attribute_failed:
      return "AttributeFailed";
  }
  return "Unknown";
}

audit_log_t::audit_log_t(const fs::path &log_path) : _os(&_file) {
  _file.open(log_path, std::ios::out | std::ios::trunc);
  if (!_file.is_open() || !_file.good()) {
    throw std::runtime_error("error opening audit log: " + log_path.string());
  }
  struct stat st {};
  if (::stat(log_path.c_str(), &st) == 0) {
    _has_id = true;
    _dev = static_cast<uint64_t>(st.st_dev);
    _ino = static_cast<uint64_t>(st.st_ino);
  }
}

audit_log_t::~audit_log_t() {
  if (_file.is_open()) {
    _file.flush();
    _file.close();
  }
}

void audit_log_t::record(action_t action, const fs::path &subject,
                         std::string_view detail) {
  {
    oss line(*_os);
    line << verb(action) << '\t' << subject.native();
    if (!detail.empty()) {
      line << '\t' << detail;
    }
    line << '\n';
  }
  ++_records;
  if (is_failure(action)) {
    ++_failures;
    oss(std::cerr, level_t::warn) << verb(action) << ": " << subject
                                  << (detail.empty() ? "" : " - ") << detail
                                  << '\n';
  }
}

void audit_log_t::record(action_t action, const fs::path &subject,
                         const std::error_code &ec) {
  record(action, subject, ec ? ec.message() : std::string());
}

void audit_log_t::flush() { oss(*_os) << std::flush; }

}  // namespace detail_v1

}  // namespace treeprep
