#pragma once
#include "model/Process.hpp"
#include <chrono>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace hostwatch::collectors {

// Traditional /proc scanner. CPU percent is a process's share of machine CPU
// time between two scans, scaled per core (a process saturating two cores
// reads 200%).
class ProcessCollector {
public:
  explicit ProcessCollector(size_t top_n = 10);

  // One scan, diffed against the previous scan. Processes that were not in
  // the previous scan report 0%. Processes that vanish or fail to parse are
  // skipped and counted. Returns false when /proc cannot be listed.
  bool sample(hostwatch::model::ProcessSnapshot& out, std::stop_token st = {});

  // Prime scan, wait for window, then sample.
  bool measure(hostwatch::model::ProcessSnapshot& out, std::chrono::milliseconds window,
               std::stop_token st = {});

private:
  std::unordered_map<int32_t, uint64_t> last_per_proc_{}; // pid -> total_time
  uint64_t last_cpu_total_{};
  bool have_last_{false};
  size_t top_n_{};
  unsigned ncpu_{0};

  static bool parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                              int64_t& rss_pages, std::string& comm);
};

} // namespace hostwatch::collectors
