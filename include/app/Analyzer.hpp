#pragma once
#include <deque>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "model/Alert.hpp"
#include "model/Snapshot.hpp"

namespace hostwatch::app {

struct AlertRules {
  double cpu_threshold    = 80.0;
  double memory_threshold = 90.0;
  double disk_threshold   = 90.0;
  double critical_pct     = 95.0;  // any breach above this is critical
  size_t sustain_count    = 3;     // consecutive cpu breaches that force critical
  double spike_delta_pct  = 30.0;
  double spike_floor_pct  = 50.0;
  size_t leak_window      = 4;
  double leak_growth_pct  = 10.0;
  // Spike mean over history without the sample just appended
  bool exclude_current_from_baseline = false;
};

AlertRules rules_from_config(const MonitorConfig& cfg);

// Threshold and trend evaluation over a bounded history of snapshots.
// Not synchronized; one instance belongs to one monitoring loop.
class Analyzer {
public:
  static constexpr size_t kHistoryCapacity = 10;
  static constexpr size_t kAnomalyMinHistory = 5;

  explicit Analyzer(AlertRules rules = {});

  // Appends s to history (evicting the oldest at capacity), then evaluates
  // cpu, memory and disk thresholds followed by the anomaly rules.
  std::vector<hostwatch::model::Alert> analyze(const hostwatch::model::Snapshot& s);

  // Advisory strings derived from alerts only; duplicates are dropped.
  std::vector<std::string> recommendations(const hostwatch::model::Snapshot& s,
                                           const std::vector<hostwatch::model::Alert>& alerts) const;

  [[nodiscard]] size_t history_size() const { return history_.size(); }
  [[nodiscard]] bool anomalies_active() const { return history_.size() >= kAnomalyMinHistory; }
  [[nodiscard]] const AlertRules& rules() const { return rules_; }

private:
  void check_cpu(const hostwatch::model::Snapshot& s, std::vector<hostwatch::model::Alert>& out) const;
  void check_memory(const hostwatch::model::Snapshot& s, std::vector<hostwatch::model::Alert>& out) const;
  void check_disks(const hostwatch::model::Snapshot& s, std::vector<hostwatch::model::Alert>& out) const;
  void check_cpu_spike(const hostwatch::model::Snapshot& s, std::vector<hostwatch::model::Alert>& out) const;
  void check_memory_leak(const hostwatch::model::Snapshot& s, std::vector<hostwatch::model::Alert>& out) const;

  AlertRules rules_;
  std::deque<hostwatch::model::Snapshot> history_;
};

// Stable descending sort by cpu (or resident memory when by_memory), then
// truncated to min(n, size). Equal keys keep their incoming order.
std::vector<hostwatch::model::ProcSample> top_processes(const hostwatch::model::Snapshot& s,
                                                        bool by_memory, size_t n);

} // namespace hostwatch::app
