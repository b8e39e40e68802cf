#include "app/Orchestrator.hpp"

#include <algorithm>
#include <thread>

namespace hostwatch::app {

RunOptions RunOptions::from_config(const MonitorConfig& cfg) {
  RunOptions o{};
  o.interval = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.interval());
  o.run_once = cfg.run_once;
  o.max_iterations = cfg.max_iterations;
  return o;
}

Orchestrator::Orchestrator(ISnapshotSource& source, Analyzer& analyzer,
                           std::vector<IReportSink*> sinks, RunOptions opts)
    : source_(source), analyzer_(analyzer), sinks_(std::move(sinks)), opts_(opts) {}

RunStatus Orchestrator::run(const std::atomic<bool>& stop) {
  const auto start = std::chrono::steady_clock::now();
  RunSummary summary{};
  int successes = 0;
  iterations_ = 0; failures_ = 0;

  while (true) {
    if (stop.load()) { summary.reason = "stopped by signal"; break; }
    int iteration = ++iterations_;
    bool ok = run_cycle(iteration);
    if (ok) ++successes; else ++failures_;

    if (opts_.run_once) {
      summary.reason = ok ? "single cycle complete" : "collection failed";
      break;
    }
    if (opts_.max_iterations > 0 && iteration >= opts_.max_iterations) {
      summary.reason = "iteration limit reached";
      break;
    }
    if (!sleep_interval(stop)) { summary.reason = "stopped by signal"; break; }
  }

  summary.status = successes > 0 ? RunStatus::Success : RunStatus::Failed;
  summary.iterations = iterations_;
  summary.failures = failures_;
  summary.elapsed = std::chrono::steady_clock::now() - start;
  for (auto* sink : sinks_) sink->finished(summary);
  return summary.status;
}

bool Orchestrator::run_cycle(int iteration) {
  CollectResult res = source_.collect();
  if (!res.ok()) {
    for (auto* sink : sinks_) sink->collection_failed(iteration, res.errors);
    return false;
  }

  CycleReport r{};
  r.iteration = iteration;
  r.snapshot = std::move(res.snapshot);
  r.alerts = analyzer_.analyze(r.snapshot);
  r.recommendations = analyzer_.recommendations(r.snapshot, r.alerts);
  r.top_cpu = top_processes(r.snapshot, false, opts_.report_top);
  r.top_memory = top_processes(r.snapshot, true, opts_.report_top);
  for (auto* sink : sinks_) sink->report(r);

  for (const auto& a : r.alerts) {
    if (a.level != hostwatch::model::AlertLevel::Critical) continue;
    ActionItem item{iteration, "CRITICAL: " + a.message, a};
    for (auto* sink : sinks_) sink->actionable(item);
  }
  return true;
}

bool Orchestrator::sleep_interval(const std::atomic<bool>& stop) const {
  using namespace std::chrono;
  const auto slice = milliseconds(100);
  const auto until = steady_clock::now() + opts_.interval;
  while (!stop.load()) {
    auto now = steady_clock::now();
    if (now >= until) return true;
    std::this_thread::sleep_for(std::min<steady_clock::duration>(slice, until - now));
  }
  return false;
}

} // namespace hostwatch::app
