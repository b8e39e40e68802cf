#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostwatch::model {

struct ProcSample {
  int32_t pid{};
  std::string name;      // comm from /proc/<pid>/stat
  uint64_t total_time{}; // utime+stime, jiffies
  uint64_t rss_kb{};
  double   cpu_pct{};    // per-core scale, may exceed 100 on multi-core hosts
  double   mem_pct{};    // rss / MemTotal, 0..100

  double memory_mb() const { return static_cast<double>(rss_kb) / 1024.0; }
};

struct ProcessSnapshot {
  std::vector<ProcSample> processes; // sorted by cpu desc, truncated to top-N
  size_t total_processes{};          // processes successfully scanned
  size_t skipped_processes{};        // vanished or unparsable mid-scan
};

} // namespace hostwatch::model
