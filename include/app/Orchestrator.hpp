#pragma once
#include <atomic>
#include <chrono>
#include <vector>
#include "app/Analyzer.hpp"
#include "app/Collector.hpp"
#include "app/Config.hpp"
#include "app/Report.hpp"

namespace hostwatch::app {

struct RunOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  bool run_once{true};
  int max_iterations{0};      // continuous mode; 0 = until stopped
  size_t report_top{5};       // entries in CycleReport::top_cpu / top_memory

  static RunOptions from_config(const MonitorConfig& cfg);
};

// Collect -> analyze -> report loop. Single-shot runs stop after one
// successful cycle and fail on a collection error; continuous runs retry a
// failed cycle after the normal interval.
class Orchestrator {
public:
  Orchestrator(ISnapshotSource& source, Analyzer& analyzer,
               std::vector<IReportSink*> sinks, RunOptions opts);

  // Blocks until the run ends. stop is polled between cycles and while
  // sleeping; the summary is handed to every sink before returning.
  RunStatus run(const std::atomic<bool>& stop);

  [[nodiscard]] int iterations() const { return iterations_; }
  [[nodiscard]] int failures() const { return failures_; }

private:
  bool run_cycle(int iteration);
  bool sleep_interval(const std::atomic<bool>& stop) const;

  ISnapshotSource& source_;
  Analyzer& analyzer_;
  std::vector<IReportSink*> sinks_;
  RunOptions opts_;
  int iterations_{0};
  int failures_{0};
};

} // namespace hostwatch::app
