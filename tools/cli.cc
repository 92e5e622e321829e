#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "declutter.hh"

using namespace std::literals;

namespace {

std::atomic<bool> cancel_flag{false};

void on_sigint(int) { cancel_flag.store(true); }

void usage() {
  std::cerr << "usage: [-d dir] [-f dedupe|organize|both] [-s strategy] "
               "[-m date|quarter] [-j jobs] [-a algo] [-l logfile] [-q] "
               "[-h/--help]\n"
               "strategy: oldest newest largest smallest shortest_path "
               "longest_path\n"
               "logfile: duplicate_files_log_<time>.txt in the current "
               "directory when deduplicating"
            << std::endl;
}

std::string format_mb(const uint64_t bytes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f MB",
                static_cast<double>(bytes) / (1024.0 * 1024.0));
  return buf;
}

}  // namespace

int main(int argc, char* argv[]) {
  declutter::run_opts_t opts;
  opts.dir = std::filesystem::current_path();

  for (int i = 1; i < argc; ++i) {
    const bool has_val = i + 1 < argc;
    if (argv[i] == "-d"sv || argv[i] == "--directory"sv) {
      if (!has_val) {
        std::cerr << "missing directory" << std::endl;
        return 1;
      }
      opts.dir = argv[++i];
    } else if (argv[i] == "-f"sv || argv[i] == "--function"sv) {
      if (!has_val) {
        std::cerr << "missing function" << std::endl;
        return 1;
      }
      auto job = declutter::parse_job(argv[++i]);
      if (!job) {
        std::cerr << "unknown function: " << argv[i] << std::endl;
        return 1;
      }
      opts.job = *job;
    } else if (argv[i] == "-s"sv || argv[i] == "--strategy"sv) {
      if (!has_val) {
        std::cerr << "missing strategy" << std::endl;
        return 1;
      }
      opts.keep = declutter::parse_keep(argv[++i]);
    } else if (argv[i] == "-m"sv || argv[i] == "--mode"sv) {
      if (!has_val) {
        std::cerr << "missing mode" << std::endl;
        return 1;
      }
      opts.bucket = declutter::parse_bucket(argv[++i]);
    } else if (argv[i] == "-j"sv) {
      if (!has_val) {
        std::cerr << "missing jobs" << std::endl;
        return 1;
      }
      try {
        const auto jobs = std::stoi(argv[++i]);
        if (jobs <= 0) {
          std::cerr << "jobs must be > 0" << std::endl;
          return 1;
        }
        opts.max_thread =
            declutter::clamp_threads(static_cast<uint32_t>(jobs));
        if (opts.max_thread != static_cast<uint32_t>(jobs)) {
          std::cerr << "jobs capped at " << opts.max_thread << std::endl;
        }
      } catch (const std::logic_error&) {
        std::cerr << "invalid jobs: " << argv[i] << std::endl;
        return 1;
      }
    } else if (argv[i] == "-a"sv) {
      if (!has_val) {
        std::cerr << "missing algo" << std::endl;
        return 1;
      }
      opts.algo = argv[++i];
    } else if (argv[i] == "-l"sv) {
      if (!has_val) {
        std::cerr << "missing logfile" << std::endl;
        return 1;
      }
      opts.log_path = argv[++i];
    } else if (argv[i] == "-q"sv) {
      declutter::log_level = declutter::log_lv_t::err;
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      usage();
      return 1;
    }
  }

  if (opts.job != declutter::job_t::organize && opts.log_path.empty()) {
    opts.log_path = std::filesystem::current_path() /
                    declutter::audit_log_name(std::chrono::system_clock::now());
  }

  std::signal(SIGINT, on_sigint);

  declutter::run_result_t result;
  try {
    result = declutter::run(opts, cancel_flag);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  if (result.status == declutter::run_status_t::cancelled) {
    std::cout << "cancelled" << std::endl;
    return 130;
  }

  std::cout << std::string(50, '=') << '\n';
  if (opts.job != declutter::job_t::organize) {
    std::cout << "deduplicate:\n"
              << "- directory: " << opts.dir.string() << '\n'
              << "- duplicate files: " << result.dupe_files << '\n'
              << "- duplicate groups: " << result.dupe_groups << '\n';
    if (result.resolved) {
      std::cout << "- moved: " << result.resolved->moved_cnt << " files\n"
                << "- moved size: " << format_mb(result.resolved->moved_bytes)
                << '\n'
                << "- quarantine folder: "
                << result.resolved->quarantine_dir.string() << '\n';
    }
  }
  if (result.classified) {
    std::cout << "organize:\n"
              << "- directory: " << opts.dir.string() << '\n'
              << "- images: " << result.classified->total << '\n'
              << "- organized: " << result.classified->organized << '\n'
              << "- skipped: " << result.classified->skipped << '\n';
  }
  std::cout << std::string(50, '=') << std::endl;

  return result.audit_ok ? 0 : 1;
}
