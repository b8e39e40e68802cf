#include "app/Analyzer.hpp"
#include "util/Format.hpp"

#include <algorithm>

namespace hostwatch::app {

using hostwatch::model::Alert;
using hostwatch::model::AlertCategory;
using hostwatch::model::AlertLevel;
using hostwatch::model::Snapshot;
using hostwatch::util::strprintf;

AlertRules rules_from_config(const MonitorConfig& cfg) {
  AlertRules r{};
  r.cpu_threshold = cfg.cpu_threshold;
  r.memory_threshold = cfg.memory_threshold;
  r.disk_threshold = cfg.disk_threshold;
  r.exclude_current_from_baseline = cfg.exclude_current_from_baseline;
  return r;
}

Analyzer::Analyzer(AlertRules rules) : rules_(rules) {}

std::vector<Alert> Analyzer::analyze(const Snapshot& s) {
  history_.push_back(s);
  while (history_.size() > kHistoryCapacity) history_.pop_front();

  std::vector<Alert> out;
  check_cpu(s, out);
  check_memory(s, out);
  check_disks(s, out);
  if (anomalies_active()) {
    check_cpu_spike(s, out);
    check_memory_leak(s, out);
  }
  return out;
}

void Analyzer::check_cpu(const Snapshot& s, std::vector<Alert>& out) const {
  const double usage = s.cpu.usage_pct;
  if (usage <= rules_.cpu_threshold) return;

  Alert a{};
  a.category = AlertCategory::Cpu;
  a.level = usage > rules_.critical_pct ? AlertLevel::Critical : AlertLevel::Warning;
  a.value = usage;
  a.threshold = rules_.cpu_threshold;
  a.timestamp = s.timestamp;
  a.message = strprintf("CPU usage is %.1f%% (threshold: %.1f%%)", usage, rules_.cpu_threshold);

  // trailing run of breaches, current sample included
  size_t run = 0;
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->cpu.usage_pct <= rules_.cpu_threshold) break;
    ++run;
  }
  // the message counts every retained entry, not just the run
  if (run >= rules_.sustain_count) {
    a.level = AlertLevel::Critical;
    a.message = strprintf("Sustained high CPU usage: %.1f%% for %zu measurements",
                          usage, history_.size());
  }
  out.push_back(std::move(a));
}

void Analyzer::check_memory(const Snapshot& s, std::vector<Alert>& out) const {
  const double used = s.mem.used_pct;
  if (used <= rules_.memory_threshold) return;
  Alert a{};
  a.category = AlertCategory::Memory;
  a.level = used > rules_.critical_pct ? AlertLevel::Critical : AlertLevel::Warning;
  a.value = used;
  a.threshold = rules_.memory_threshold;
  a.timestamp = s.timestamp;
  a.message = strprintf("Memory usage is %.1f%% (%.1f GB / %.1f GB)",
                        used, s.mem.used_gb(), s.mem.total_gb());
  out.push_back(std::move(a));
}

void Analyzer::check_disks(const Snapshot& s, std::vector<Alert>& out) const {
  for (const auto& m : s.fs.mounts) {
    if (m.used_pct <= rules_.disk_threshold) continue;
    Alert a{};
    a.category = AlertCategory::Disk;
    a.level = m.used_pct > rules_.critical_pct ? AlertLevel::Critical : AlertLevel::Warning;
    a.value = m.used_pct;
    a.threshold = rules_.disk_threshold;
    a.timestamp = s.timestamp;
    a.message = strprintf("Disk %s usage is %.1f%% (%.1f GB free)",
                          m.mountpoint.c_str(), m.used_pct, m.free_gb());
    out.push_back(std::move(a));
  }
}

void Analyzer::check_cpu_spike(const Snapshot& s, std::vector<Alert>& out) const {
  // history_.back() is s unless the baseline excludes it
  size_t n = history_.size();
  if (rules_.exclude_current_from_baseline) --n;
  if (n == 0) return;
  double sum = 0.0;
  for (size_t i = 0; i < n; ++i) sum += history_[i].cpu.usage_pct;
  const double mean = sum / static_cast<double>(n);
  const double cur = s.cpu.usage_pct;
  if (cur - mean > rules_.spike_delta_pct && cur > rules_.spike_floor_pct) {
    Alert a{};
    a.category = AlertCategory::Cpu;
    a.level = AlertLevel::Warning;
    a.value = cur;
    a.threshold = mean;
    a.timestamp = s.timestamp;
    a.message = strprintf("CPU spike detected: %.1f%% (%.1f%% above average)", cur, cur - mean);
    out.push_back(std::move(a));
  }
}

void Analyzer::check_memory_leak(const Snapshot& s, std::vector<Alert>& out) const {
  const size_t w = rules_.leak_window;
  if (w < 2 || history_.size() < w) return;
  const size_t first = history_.size() - w;
  for (size_t i = first + 1; i < history_.size(); ++i) {
    if (history_[i].mem.used_pct <= history_[i - 1].mem.used_pct) return;
  }
  const double growth = history_.back().mem.used_pct - history_[first].mem.used_pct;
  if (growth <= rules_.leak_growth_pct) return;
  Alert a{};
  a.category = AlertCategory::Memory;
  a.level = AlertLevel::Warning;
  a.value = s.mem.used_pct;
  a.threshold = rules_.memory_threshold;
  a.timestamp = s.timestamp;
  a.message = "Potential memory leak detected: memory usage consistently increasing";
  out.push_back(std::move(a));
}

std::vector<std::string> Analyzer::recommendations(const Snapshot& s,
                                                   const std::vector<Alert>& alerts) const {
  std::vector<std::string> out;
  auto add = [&out](std::string r) {
    if (std::find(out.begin(), out.end(), r) == out.end()) out.push_back(std::move(r));
  };
  for (const auto& a : alerts) {
    if (a.category == AlertCategory::Cpu && a.level == AlertLevel::Critical) {
      auto top = top_processes(s, false, 1);
      if (!top.empty())
        add(strprintf("Consider terminating or optimizing high CPU process: %s (%.1f%% CPU)",
                      top[0].name.c_str(), top[0].cpu_pct));
    } else if (a.category == AlertCategory::Disk && a.level == AlertLevel::Critical) {
      add("Critical: Clean up disk space immediately to prevent system issues");
      add("Run disk cleanup tools or remove unnecessary files");
    } else if (a.category == AlertCategory::Memory && a.level == AlertLevel::Warning) {
      auto top = top_processes(s, true, 1);
      if (!top.empty())
        add(strprintf("High memory consumer: %s (%.1f MB)", top[0].name.c_str(), top[0].memory_mb()));
    }
  }
  return out;
}

std::vector<hostwatch::model::ProcSample> top_processes(const Snapshot& s, bool by_memory, size_t n) {
  std::vector<hostwatch::model::ProcSample> out = s.procs.processes;
  if (by_memory) {
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.rss_kb > b.rss_kb; });
  } else {
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.cpu_pct > b.cpu_pct; });
  }
  if (out.size() > n) out.resize(n);
  return out;
}

} // namespace hostwatch::app
