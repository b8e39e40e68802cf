#pragma once
#include <chrono>
#include <cstdint>
#include "model/Cpu.hpp"
#include "model/Fs.hpp"
#include "model/Load.hpp"
#include "model/Process.hpp"

namespace hostwatch::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t available_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_used_kb{};
  double   used_pct{};      // 0..100
  double   swap_used_pct{}; // 0..100, 0 when no swap

  double total_gb()     const { return static_cast<double>(total_kb) / (1024.0 * 1024.0); }
  double used_gb()      const { return static_cast<double>(used_kb) / (1024.0 * 1024.0); }
  double available_gb() const { return static_cast<double>(available_kb) / (1024.0 * 1024.0); }
  double swap_total_gb() const { return static_cast<double>(swap_total_kb) / (1024.0 * 1024.0); }
  double swap_used_gb()  const { return static_cast<double>(swap_used_kb) / (1024.0 * 1024.0); }
};

// One complete measurement. Built by app::Collector and handed out by value;
// nothing downstream modifies it.
struct Snapshot {
  std::chrono::system_clock::time_point timestamp{};
  CpuSnapshot cpu;
  Memory mem;
  FsSnapshot fs;
  LoadAvg load;
  ProcessSnapshot procs;
};

} // namespace hostwatch::model
