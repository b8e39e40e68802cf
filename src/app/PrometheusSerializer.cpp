#include "app/MetricsServer.hpp"
#include "util/Format.hpp"
#include <algorithm>
#include <charconv>
#include <string_view>
#include <type_traits>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv, size_t max_len = 0) {
  size_t limit = (max_len > 0) ? std::min(sv.size(), max_len) : sv.size();
  for (size_t i = 0; i < limit; ++i) {
    char c = sv[i];
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// name{key="val"} value
void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

// name{k1="v1",k2="v2"} value; v2 is capped at 32 chars
template <typename T>
void emit_labeled_2(std::string& out, const char* name,
                    const char* k1, std::string_view v1,
                    const char* k2, std::string_view v2, T value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2, 32);  out += "\"} ";
  if constexpr (std::is_floating_point_v<T>) append_double(out, value);
  else append_uint(out, static_cast<uint64_t>(value));
  out += '\n';
}

template <typename T>
void emit_labeled_3(std::string& out, const char* name,
                    const char* k1, std::string_view v1,
                    const char* k2, std::string_view v2,
                    const char* k3, std::string_view v3, T value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\",";
  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  if constexpr (std::is_floating_point_v<T>) append_double(out, value);
  else append_uint(out, static_cast<uint64_t>(value));
  out += '\n';
}

void emit_procs(std::string& out, const char* cpu_name, const char* mem_name,
                const std::vector<hostwatch::model::ProcSample>& procs) {
  if (procs.empty()) return;
  emit_header(out, cpu_name, "Per-process CPU utilization (100 = one core)", "gauge");
  for (const auto& p : procs) {
    char pid_buf[12];
    auto [pptr, pec] = std::to_chars(pid_buf, pid_buf + sizeof(pid_buf), p.pid);
    emit_labeled_2(out, cpu_name, "pid", std::string_view(pid_buf, pptr), "name", p.name, p.cpu_pct);
  }
  emit_header(out, mem_name, "Per-process resident memory", "gauge");
  for (const auto& p : procs) {
    char pid_buf[12];
    auto [pptr, pec] = std::to_chars(pid_buf, pid_buf + sizeof(pid_buf), p.pid);
    emit_labeled_2(out, mem_name, "pid", std::string_view(pid_buf, pptr), "name", p.name, p.rss_kb * 1024ULL);
  }
}

} // anonymous namespace

namespace hostwatch::app {

std::string cycle_to_prometheus(const CycleReport& r) {
  using hostwatch::model::AlertCategory;
  using hostwatch::model::AlertLevel;
  const auto& s = r.snapshot;
  std::string out;
  out.reserve(8192);

  emit_header(out, "hostwatch_cycle_iteration", "Cycle number within this run", "gauge");
  emit_gauge_u(out, "hostwatch_cycle_iteration", static_cast<uint64_t>(r.iteration));
  emit_header(out, "hostwatch_snapshot_timestamp_ms", "Snapshot wall-clock time", "gauge");
  emit_gauge_u(out, "hostwatch_snapshot_timestamp_ms",
               static_cast<uint64_t>(hostwatch::util::epoch_ms(s.timestamp)));

  // ---- CPU ----
  emit_header(out, "hostwatch_cpu_usage_percent", "Aggregate CPU utilization", "gauge");
  emit_gauge_d(out, "hostwatch_cpu_usage_percent", s.cpu.usage_pct);
  emit_header(out, "hostwatch_cpu_cores", "Logical CPUs", "gauge");
  emit_gauge_u(out, "hostwatch_cpu_cores", static_cast<uint64_t>(std::max(0, s.cpu.cores)));
  if (!s.cpu.per_core_pct.empty()) {
    emit_header(out, "hostwatch_cpu_core_usage_percent", "Per-core CPU utilization", "gauge");
    for (size_t i = 0; i < s.cpu.per_core_pct.size(); ++i) {
      char idx[8];
      auto [ptr, ec] = std::to_chars(idx, idx + sizeof(idx), i);
      emit_labeled_d(out, "hostwatch_cpu_core_usage_percent", "core",
                     std::string_view(idx, ptr), s.cpu.per_core_pct[i]);
    }
  }

  // ---- Memory (KB * 1024 -> bytes) ----
  emit_header(out, "hostwatch_memory_total_bytes", "Total physical memory", "gauge");
  emit_gauge_u(out, "hostwatch_memory_total_bytes", s.mem.total_kb * 1024ULL);
  emit_header(out, "hostwatch_memory_used_bytes", "Used physical memory", "gauge");
  emit_gauge_u(out, "hostwatch_memory_used_bytes", s.mem.used_kb * 1024ULL);
  emit_header(out, "hostwatch_memory_available_bytes", "Available memory", "gauge");
  emit_gauge_u(out, "hostwatch_memory_available_bytes", s.mem.available_kb * 1024ULL);
  emit_header(out, "hostwatch_memory_used_percent", "Memory utilization percent", "gauge");
  emit_gauge_d(out, "hostwatch_memory_used_percent", s.mem.used_pct);
  emit_header(out, "hostwatch_swap_total_bytes", "Total swap space", "gauge");
  emit_gauge_u(out, "hostwatch_swap_total_bytes", s.mem.swap_total_kb * 1024ULL);
  emit_header(out, "hostwatch_swap_used_bytes", "Used swap space", "gauge");
  emit_gauge_u(out, "hostwatch_swap_used_bytes", s.mem.swap_used_kb * 1024ULL);
  emit_header(out, "hostwatch_swap_used_percent", "Swap utilization percent", "gauge");
  emit_gauge_d(out, "hostwatch_swap_used_percent", s.mem.swap_used_pct);

  // ---- Filesystem ----
  if (!s.fs.mounts.empty()) {
    emit_header(out, "hostwatch_filesystem_total_bytes", "Filesystem total size", "gauge");
    for (const auto& m : s.fs.mounts)
      emit_labeled_3(out, "hostwatch_filesystem_total_bytes", "device", m.device, "mountpoint", m.mountpoint, "fstype", m.fstype, m.total_bytes);
    emit_header(out, "hostwatch_filesystem_free_bytes", "Filesystem bytes available to users", "gauge");
    for (const auto& m : s.fs.mounts)
      emit_labeled_3(out, "hostwatch_filesystem_free_bytes", "device", m.device, "mountpoint", m.mountpoint, "fstype", m.fstype, m.avail_bytes);
    emit_header(out, "hostwatch_filesystem_used_percent", "Filesystem utilization percent", "gauge");
    for (const auto& m : s.fs.mounts)
      emit_labeled_3(out, "hostwatch_filesystem_used_percent", "device", m.device, "mountpoint", m.mountpoint, "fstype", m.fstype, m.used_pct);
  }

  // ---- Load ----
  if (s.load.has_load) {
    emit_header(out, "hostwatch_load1", "1-minute load average", "gauge");
    emit_gauge_d(out, "hostwatch_load1", s.load.load1);
    emit_header(out, "hostwatch_load5", "5-minute load average", "gauge");
    emit_gauge_d(out, "hostwatch_load5", s.load.load5);
    emit_header(out, "hostwatch_load15", "15-minute load average", "gauge");
    emit_gauge_d(out, "hostwatch_load15", s.load.load15);
  }

  // ---- Processes ----
  emit_header(out, "hostwatch_processes_scanned", "Processes read in the last scan", "gauge");
  emit_gauge_u(out, "hostwatch_processes_scanned", static_cast<uint64_t>(s.procs.total_processes));
  emit_header(out, "hostwatch_processes_skipped", "Processes that vanished mid-scan", "gauge");
  emit_gauge_u(out, "hostwatch_processes_skipped", static_cast<uint64_t>(s.procs.skipped_processes));
  emit_procs(out, "hostwatch_process_cpu_percent", "hostwatch_process_memory_bytes", s.procs.processes);

  // ---- Alerts: every level/category pair, zero included ----
  emit_header(out, "hostwatch_alerts", "Alerts raised by the last cycle", "gauge");
  for (auto lvl : {AlertLevel::Warning, AlertLevel::Critical}) {
    for (auto cat : {AlertCategory::Cpu, AlertCategory::Memory, AlertCategory::Disk}) {
      uint64_t n = static_cast<uint64_t>(std::count_if(r.alerts.begin(), r.alerts.end(),
          [&](const auto& a){ return a.level == lvl && a.category == cat; }));
      emit_labeled_2(out, "hostwatch_alerts", "level", hostwatch::model::to_string(lvl),
                     "category", hostwatch::model::to_string(cat), n);
    }
  }
  emit_header(out, "hostwatch_recommendations", "Recommendations produced by the last cycle", "gauge");
  emit_gauge_u(out, "hostwatch_recommendations", static_cast<uint64_t>(r.recommendations.size()));

  return out;
}

} // namespace hostwatch::app
