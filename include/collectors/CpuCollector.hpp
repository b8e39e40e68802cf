#pragma once
#include <chrono>
#include <stop_token>
#include <string>
#include <vector>
#include "model/Cpu.hpp"

namespace hostwatch::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // Delta sample against the previous call. The first call only primes the
  // counters and reports 0% usage.
  bool sample(hostwatch::model::CpuSnapshot& out);
  // Prime, wait for window, sample again. Aggregate and per-core percentages
  // come from the same window. Returns false on read failure or stop.
  bool measure(hostwatch::model::CpuSnapshot& out, std::chrono::milliseconds window,
               std::stop_token st = {});
  [[nodiscard]] const std::string& last_error() const { return error_; }
private:
  hostwatch::model::CpuTimes last_total_{};
  std::vector<hostwatch::model::CpuTimes> last_per_{};
  bool has_last_{false};
  std::string error_{};
};

} // namespace hostwatch::collectors
