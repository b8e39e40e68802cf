#include "app/ConsoleSink.hpp"
#include "util/Format.hpp"
#include "util/Retro.hpp"

namespace hostwatch::app {

using hostwatch::model::to_string;

ConsoleSink::ConsoleSink(bool quiet, std::FILE* out, std::FILE* err)
    : quiet_(quiet), out_(out), err_(err) {}

static void print_bar(std::FILE* f, const char* label, double pct, const std::string& suffix) {
  std::fprintf(f, "%-8s%s %5.1f%% %s\n", label, hostwatch::util::retro_bar(pct, 20).c_str(),
               pct, suffix.c_str());
}

static void print_procs(std::FILE* f, const char* title,
                        const std::vector<hostwatch::model::ProcSample>& procs) {
  if (procs.empty()) return;
  std::fprintf(f, "%s\n", title);
  std::fprintf(f, "  %7s  %-16s %7s %10s %6s\n", "PID", "NAME", "CPU%", "RSS MB", "MEM%");
  for (const auto& p : procs) {
    std::fprintf(f, "  %7d  %-16.16s %7.1f %10.1f %6.1f\n",
                 p.pid, p.name.c_str(), p.cpu_pct, p.memory_mb(), p.mem_pct);
  }
}

void ConsoleSink::report(const CycleReport& r) {
  using hostwatch::util::strprintf;
  // one line per alert, also in quiet mode
  for (const auto& a : r.alerts) {
    std::fprintf(err_, "hostwatch: alert: [%s] %s value=%.1f threshold=%.1f: %s\n",
                 to_string(a.level), to_string(a.category), a.value, a.threshold, a.message.c_str());
  }
  if (quiet_) return;

  const auto& s = r.snapshot;
  std::fprintf(out_, "=== hostwatch cycle %d @ %s ===\n", r.iteration,
               hostwatch::util::format_iso8601(s.timestamp).c_str());
  print_bar(out_, "CPU", s.cpu.usage_pct, strprintf("(%d cores)", s.cpu.cores));
  print_bar(out_, "Memory", s.mem.used_pct,
            strprintf("%.1f / %.1f GB, swap %.1f%%", s.mem.used_gb(), s.mem.total_gb(), s.mem.swap_used_pct));
  for (const auto& m : s.fs.mounts) {
    print_bar(out_, "Disk", m.used_pct, strprintf("%s (%.1f GB free)", m.mountpoint.c_str(), m.free_gb()));
  }
  if (s.load.has_load)
    std::fprintf(out_, "%-8s%.2f %.2f %.2f\n", "Load", s.load.load1, s.load.load5, s.load.load15);
  else
    std::fprintf(out_, "%-8sn/a\n", "Load");
  std::fprintf(out_, "%-8s%zu scanned, %zu skipped\n", "Procs",
               s.procs.total_processes, s.procs.skipped_processes);

  print_procs(out_, "Top CPU:", r.top_cpu);
  print_procs(out_, "Top memory:", r.top_memory);

  if (r.alerts.empty()) {
    std::fprintf(out_, "Alerts: none\n");
  } else {
    std::fprintf(out_, "Alerts:\n");
    for (const auto& a : r.alerts)
      std::fprintf(out_, "  [%s] %s\n", to_string(a.level), a.message.c_str());
  }
  if (!r.recommendations.empty()) {
    std::fprintf(out_, "Recommendations:\n");
    for (const auto& rec : r.recommendations) std::fprintf(out_, "  - %s\n", rec.c_str());
  }
  std::fflush(out_);
}

void ConsoleSink::actionable(const ActionItem& item) {
  std::fprintf(err_, "hostwatch: action: cycle %d: %s\n", item.iteration, item.title.c_str());
}

void ConsoleSink::collection_failed(int iteration, const std::vector<ProbeError>& errors) {
  std::fprintf(err_, "hostwatch: cycle %d: collection failed (%zu error%s)\n",
               iteration, errors.size(), errors.size() == 1 ? "" : "s");
}

void ConsoleSink::finished(const RunSummary& summary) {
  std::fprintf(err_, "hostwatch: run %s: %d cycle%s, %d failed, %s (%s)\n",
               to_string(summary.status), summary.iterations, summary.iterations == 1 ? "" : "s",
               summary.failures, hostwatch::util::format_duration(summary.elapsed).c_str(),
               summary.reason.c_str());
}

} // namespace hostwatch::app
