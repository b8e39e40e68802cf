#pragma once
#include <cstdint>
#include <vector>

namespace hostwatch::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  double usage_pct{};               // aggregate percent 0..100 over the sampling window
  int cores{0};                     // logical CPUs
  std::vector<double> per_core_pct; // size == cores
};

} // namespace hostwatch::model
