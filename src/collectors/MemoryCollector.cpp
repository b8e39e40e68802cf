#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace hostwatch::collectors {

static inline uint64_t parse_kb(std::string_view sv) {
  uint64_t v = 0;
  // strip unit suffix (kB) and surrounding blanks
  while (!sv.empty() && (sv.back() < '0' || sv.back() > '9')) sv.remove_suffix(1);
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  std::from_chars(sv.data(), sv.data() + sv.size(), v);
  return v;
}

static inline double pct_of(uint64_t part, uint64_t whole) {
  return whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

bool MemoryCollector::sample(hostwatch::model::Memory& out) {
  auto txt_opt = hostwatch::util::read_file_string("/proc/meminfo");
  if (!txt_opt) { error_ = "cannot read /proc/meminfo"; return false; }
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0, swap_total = 0, swap_free = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_kb(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_kb(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_kb(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_kb(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_kb(line.substr(7));
    else if (line.starts_with("SwapTotal:")) swap_total = parse_kb(line.substr(10));
    else if (line.starts_with("SwapFree:")) swap_free = parse_kb(line.substr(9));
    start = end + 1;
  }
  if (mem_total == 0) { error_ = "MemTotal missing from /proc/meminfo"; return false; }

  // Pre-3.14 kernels have no MemAvailable
  uint64_t avail = have_avail ? mem_avail : mem_free + buffers + cached;
  if (avail > mem_total) avail = mem_total;
  out.total_kb = mem_total;
  out.available_kb = avail;
  out.used_kb = mem_total - avail;
  out.used_pct = pct_of(out.used_kb, mem_total);
  out.swap_total_kb = swap_total;
  out.swap_used_kb  = (swap_total > swap_free) ? (swap_total - swap_free) : 0;
  out.swap_used_pct = pct_of(out.swap_used_kb, swap_total);
  error_.clear();
  return true;
}

} // namespace hostwatch::collectors
