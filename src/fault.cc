#include "treeprep/fault.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace {

class fault_category_t : public std::error_category {
 public:
  const char *name() const noexcept override { return "treeprep"; }

  std::string message(int ev) const override {
    switch (static_cast<fault_t>(ev)) {
      case fault_t::path_invalid:
        return "path invalid";
      case fault_t::unreadable_file:
        return "unreadable file";
      case fault_t::rename_failed:
        return "rename failed";
      case fault_t::removal_failed:
        return "removal failed";
      case fault_t::name_collision:
        return "name collision";
      case fault_t::path_still_too_long:
        return "path still too long";
      case fault_t::attribute_failed:
        return "attribute change failed";
    }
    return "unknown fault";
  }
};

}  // namespace

const std::error_category &fault_category() noexcept {
  static const fault_category_t category;
  return category;
}

}  // namespace detail_v1

}  // namespace treeprep
