#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "treeprep/pipeline.hh"
#include "treeprep/prune.hh"

using namespace std::literals;

namespace {

void usage() {
  std::cerr
      << "usage: treeprep -i source_root [-i source_root ...] -l audit_log\n"
         "                [-m max_path] [-x unsupported_ext] [-v vendor_ext]\n"
         "                [-a archive_ext] [-H hash_algo] [-j jobs]\n"
         "                [-n/--dry-run] [--keep-empty-dirs] [-h/--help]"
      << std::endl;
}

std::string dotted(std::string ext) {
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

}  // namespace

int main(int argc, char* argv[]) {
  treeprep::options_t opt;
  std::vector<std::string> extra_unsupported;
  std::vector<std::string> extra_vendor;

  for (int i = 1; i < argc; ++i) {
    // options taking a value
    if (argv[i] == "-i"sv || argv[i] == "-l"sv || argv[i] == "-m"sv ||
        argv[i] == "-x"sv || argv[i] == "-v"sv || argv[i] == "-a"sv ||
        argv[i] == "-H"sv || argv[i] == "-j"sv) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << argv[i] << std::endl;
        return 1;
      }
      const std::string_view opt_name = argv[i];
      const std::string value = argv[++i];
      if (opt_name == "-i"sv) {
        opt.roots.emplace_back(value);
      } else if (opt_name == "-l"sv) {
        opt.log_path = value;
      } else if (opt_name == "-m"sv) {
        try {
          opt.max_path = std::stoul(value);
        } catch (const std::exception& e) {
          std::cerr << "invalid max_path: " << value << std::endl;
          return 1;
        }
        if (opt.max_path == 0) {
          std::cerr << "max_path must be > 0" << std::endl;
          return 1;
        }
      } else if (opt_name == "-x"sv) {
        extra_unsupported.emplace_back(value);
      } else if (opt_name == "-v"sv) {
        extra_vendor.emplace_back(value);
      } else if (opt_name == "-a"sv) {
        opt.archive_suffixes.emplace_back(dotted(value));
      } else if (opt_name == "-H"sv) {
        opt.hash_algo = value;
      } else {
        try {
          opt.max_thread = (uint32_t)std::stoul(value);
        } catch (const std::exception& e) {
          std::cerr << "invalid jobs: " << value << std::endl;
          return 1;
        }
        if (opt.max_thread == 0 || opt.max_thread > 256) {
          std::cerr << "jobs must be > 0 and <= 256" << std::endl;
          return 1;
        }
      }
    } else if (argv[i] == "-n"sv || argv[i] == "--dry-run"sv) {
      opt.act = treeprep::act_t::log;
    } else if (argv[i] == "--keep-empty-dirs"sv) {
      opt.prune_empty_dirs = false;
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      usage();
      return 1;
    }
  }

  if (opt.roots.empty() || opt.log_path.empty()) {
    usage();
    return 1;
  }
  opt.unsupported = treeprep::unsupported_rule(extra_unsupported);
  opt.vendor = treeprep::vendor_rule(extra_vendor);

  try {
    treeprep::run_pipeline(opt);
  } catch (const std::exception& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
