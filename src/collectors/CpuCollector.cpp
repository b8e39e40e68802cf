#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include "util/StopWait.hpp"

#include <charconv>
#include <string_view>

namespace hostwatch::collectors {

static void parse_cpu_line(std::string_view line, hostwatch::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static double busy_pct(const hostwatch::model::CpuTimes& now, const hostwatch::model::CpuTimes& then) {
  if (now.total() <= then.total()) return 0.0;
  auto td = now.total() - then.total();
  auto wd = (now.work() > then.work()) ? now.work() - then.work() : 0;
  double pct = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  return pct > 100.0 ? 100.0 : pct;
}

bool CpuCollector::sample(hostwatch::model::CpuSnapshot& out) {
  auto txt_opt = hostwatch::util::read_file_string("/proc/stat");
  if (!txt_opt) { error_ = "cannot read /proc/stat"; return false; }
  const std::string& txt = *txt_opt;
  hostwatch::model::CpuTimes agg{}; std::vector<hostwatch::model::CpuTimes> per;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; }
    else if (after_cpu && line.starts_with("cpu")) { hostwatch::model::CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (after_cpu) break;
    start = end + 1;
  }
  if (!after_cpu) { error_ = "no aggregate cpu line in /proc/stat"; return false; }

  double usage = 0.0; std::vector<double> per_pct(per.size(), 0.0);
  if (has_last_) {
    usage = busy_pct(agg, last_total_);
    for (size_t i = 0; i < per.size() && i < last_per_.size(); ++i) {
      per_pct[i] = busy_pct(per[i], last_per_[i]);
    }
  }
  last_total_ = agg; last_per_ = std::move(per); has_last_ = true;
  if (per_pct.empty()) per_pct.push_back(usage); // kernels without per-cpu lines
  out.usage_pct = usage;
  out.cores = static_cast<int>(per_pct.size());
  out.per_core_pct = std::move(per_pct);
  error_.clear();
  return true;
}

bool CpuCollector::measure(hostwatch::model::CpuSnapshot& out, std::chrono::milliseconds window,
                           std::stop_token st) {
  has_last_ = false;
  hostwatch::model::CpuSnapshot primed{};
  if (!sample(primed)) return false;
  if (!hostwatch::util::wait_or_stop(st, window)) {
    error_ = "sampling window interrupted";
    return false;
  }
  return sample(out);
}

} // namespace hostwatch::collectors
