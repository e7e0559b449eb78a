#pragma once

#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "treeprep/fs_ops.hh"

namespace test {

// counts failed expectations, main returns finish()
class runner_t {
  std::string _suite;
  std::size_t _passed = 0;
  std::size_t _failed = 0;

 public:
  explicit runner_t(std::string suite) : _suite(std::move(suite)) {}

  void expect(bool cond, std::string_view what) {
    if (cond) {
      ++_passed;
    } else {
      ++_failed;
      std::cerr << "[fail] " << _suite << ": " << what << std::endl;
    }
  }

  template <typename Lhs, typename Rhs>
  void expect_eq(const Lhs &lhs, const Rhs &rhs, std::string_view what) {
    if (lhs == rhs) {
      ++_passed;
    } else {
      ++_failed;
      std::cerr << "[fail] " << _suite << ": " << what << " - got " << lhs
                << ", want " << rhs << std::endl;
    }
  }

  int finish() const {
    std::cerr << "[log] " << _suite << ": " << _passed << " passed, "
              << _failed << " failed" << std::endl;
    return _failed == 0 ? 0 : 1;
  }
};

// scratch directory removed on scope exit
class tmp_tree_t {
  std::filesystem::path _root;

 public:
  explicit tmp_tree_t(std::string_view tag) {
    static std::size_t seq = 0;
    _root = std::filesystem::canonical(std::filesystem::temp_directory_path()) /
            ("treeprep_" + std::string(tag) + "_" + std::to_string(::getpid()) +
             "_" + std::to_string(seq++));
    std::filesystem::remove_all(_root);
    std::filesystem::create_directories(_root / "src");
  }
  ~tmp_tree_t() {
    std::error_code ec;
    std::filesystem::permissions(_root, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
    std::filesystem::remove_all(_root, ec);
  }

  tmp_tree_t(const tmp_tree_t &) = delete;
  tmp_tree_t &operator=(const tmp_tree_t &) = delete;

  // tree to process
  std::filesystem::path src() const { return _root / "src"; }
  // audit log destination, outside the tree
  std::filesystem::path log() const { return _root / "audit.log"; }

  std::filesystem::path write(const std::filesystem::path &rel,
                              std::string_view content) const {
    auto path = src() / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
    return path;
  }

  std::filesystem::path mkdir(const std::filesystem::path &rel) const {
    auto path = src() / rel;
    std::filesystem::create_directories(path);
    return path;
  }

  bool has(const std::filesystem::path &rel) const {
    std::error_code ec;
    return std::filesystem::exists(
        std::filesystem::symlink_status(src() / rel, ec));
  }
};

// directory chain below base whose path exceeds PATH_MAX, built with
// mkdirat since no single call can name it
inline std::filesystem::path make_deep_dir(const std::filesystem::path &base) {
  const std::string comp(200, 'd');
  int dir = ::open(base.c_str(), O_RDONLY | O_DIRECTORY);
  auto path = base;
  while (path.native().size() < PATH_MAX + 100) {
    ::mkdirat(dir, comp.c_str(), 0755);
    int next = ::openat(dir, comp.c_str(), O_RDONLY | O_DIRECTORY);
    ::close(dir);
    dir = next;
    path /= comp;
  }
  ::close(dir);
  return path;
}

// file in a directory from make_deep_dir
inline std::filesystem::path write_deep(const std::filesystem::path &dir,
                                        const std::string &name,
                                        std::string_view content) {
  std::error_code ec;
  auto fd = treeprep::open_long(dir, O_RDONLY | O_DIRECTORY, ec);
  int file = ::openat(fd.get(), name.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  auto written = ::write(file, content.data(), content.size());
  (void)written;
  ::close(file);
  return dir / name;
}

// remove a make_deep_dir chain with its files, remove_all cannot reach it
inline void remove_deep(const std::filesystem::path &deep,
                        const std::filesystem::path &base) {
  for (auto dir = deep; dir != base && dir.has_relative_path();
       dir = dir.parent_path()) {
    std::error_code ec;
    for (const auto &child : treeprep::read_dir(dir, ec)) {
      if (!child.is_dir()) {
        treeprep::remove_entry(dir / child.name, ec);
      }
    }
    treeprep::remove_entry(dir, ec);
  }
}

inline std::vector<std::string> lines_of(std::string_view text) {
  std::vector<std::string> lines;
  std::istringstream iss{std::string(text)};
  for (std::string line; std::getline(iss, line);) {
    lines.emplace_back(std::move(line));
  }
  return lines;
}

inline std::vector<std::string> read_lines(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return lines_of(ss.str());
}

// records starting with VERB<TAB>
inline std::size_t count_verb(const std::vector<std::string> &lines,
                              std::string_view verb) {
  std::size_t cnt = 0;
  for (const auto &line : lines) {
    if (line.size() > verb.size() && line.compare(0, verb.size(), verb) == 0 &&
        line[verb.size()] == '\t') {
      ++cnt;
    }
  }
  return cnt;
}

}  // namespace test
