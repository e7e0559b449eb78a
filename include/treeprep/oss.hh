#pragma once

#include <ostream>
#include <version>

namespace treeprep {

inline namespace detail_v1 {

// severity tag of a diagnostic line on stderr
enum class level_t { log, warn, err };

inline const char *level_tag(const level_t level) noexcept {
  switch (level) {
    case level_t::warn:
      return "[warn] ";
    case level_t::err:
      return "[err] ";
    default:
      return "[log] ";
  }
}

}  // namespace detail_v1

}  // namespace treeprep

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace treeprep {

inline namespace detail_v1 {

// one line, emitted whole on destruction, concurrent roots never interleave
class oss : public std::osyncstream {
 public:
  using std::osyncstream::osyncstream;
  oss(std::ostream &os, const level_t level) : std::osyncstream(os) {
    *this << level_tag(level);
  }
};

}  // namespace detail_v1

}  // namespace treeprep

#else

#include <mutex>

namespace treeprep {

inline namespace detail_v1 {

// self-implemented osyncstream, one lock for every wrapped stream
class oss {
 private:
  inline static std::mutex _mtx;
  std::lock_guard<std::mutex> _lk;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _lk(_mtx), _os(os) {}
  inline oss(std::ostream &os, const level_t level) : oss(os) {
    _os << level_tag(level);
  }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline oss &operator<<(std::ostream &(*manip)(std::ostream &)) {
    _os << manip;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

}  // namespace detail_v1

}  // namespace treeprep

#endif
