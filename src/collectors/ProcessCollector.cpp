#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include "util/StopWait.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>
#include <unistd.h>

namespace hostwatch::collectors {

ProcessCollector::ProcessCollector(size_t top_n) : top_n_(top_n) {}

static uint64_t read_cpu_total() {
  auto line = hostwatch::util::read_first_line("/proc/stat"); if (!line) return 0;
  // parse after 'cpu '
  size_t pos = line->find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line->c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  uint64_t total=0; for (int j=0;j<8;++j) total+=vals[j]; return total;
}

static unsigned read_cpu_count() {
  auto txt = hostwatch::util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  return count == 0 ? 1 : count;
}

static uint64_t read_mem_total_kb() {
  auto txt = hostwatch::util::read_file_string("/proc/meminfo"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string key; uint64_t v = 0;
  while (ss >> key >> v) {
    if (key == "MemTotal:") return v;
    std::string rest; std::getline(ss, rest);
  }
  return 0;
}

bool ProcessCollector::parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                                       int64_t& rss_pages, std::string& comm) {
  // comm may itself contain parentheses; it runs to the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp||rp+2>content.size()) return false;
  comm = content.substr(lp+1, rp-lp-1);
  std::istringstream ss(content.substr(rp+2));
  char state = 0; int32_t ppid = 0;
  ss >> state >> ppid;
  // skip pgrp..cmajflt (9 fields) to reach utime
  for (int i=0;i<9;i++){ std::string tmp; ss >> tmp; }
  ss >> utime >> stime;
  // skip cutime, cstime, priority, nice, num_threads, itrealvalue, starttime, vsize
  for (int i=0;i<8;i++){ std::string tmp; ss >> tmp; }
  ss >> rss_pages;
  return !ss.fail();
}

bool ProcessCollector::sample(hostwatch::model::ProcessSnapshot& out, std::stop_token st) {
  uint64_t cpu_total = read_cpu_total();
  if (ncpu_ == 0) ncpu_ = read_cpu_count();
  const uint64_t mem_total_kb = read_mem_total_kb();
  const long page_kb = std::max(1L, ::sysconf(_SC_PAGESIZE) / 1024);

  out.processes.clear(); out.total_processes = 0; out.skipped_processes = 0;
  auto entries = hostwatch::util::list_dir("/proc");
  if (entries.empty()) return false;

  std::unordered_map<int32_t, uint64_t> seen;
  seen.reserve(entries.size());
  const uint64_t dt = (have_last_ && cpu_total > last_cpu_total_) ? (cpu_total - last_cpu_total_) : 0;
  for (const auto& name : entries) {
    if (st.stop_requested()) break;
    if (name.empty() || name[0]<'0' || name[0]>'9') continue; // numeric
    int32_t pid = 0;
    std::from_chars(name.data(), name.data() + name.size(), pid);
    auto content_opt = hostwatch::util::read_file_string("/proc/"+name+"/stat");
    uint64_t ut=0, stt=0; int64_t rssp=0; std::string comm;
    if (!content_opt || !parse_stat_line(*content_opt, ut, stt, rssp, comm) || comm.empty()) {
      // exited between readdir and read
      out.skipped_processes++;
      continue;
    }
    uint64_t total_proc = ut + stt;
    seen.emplace(pid, total_proc);
    double cpu_pct = 0.0;
    if (dt > 0) {
      auto it = last_per_proc_.find(pid);
      uint64_t lastp = (it==last_per_proc_.end()) ? total_proc : it->second;
      uint64_t dp = (total_proc > lastp) ? (total_proc - lastp) : 0;
      cpu_pct = (100.0 * static_cast<double>(dp) / static_cast<double>(dt)) * static_cast<double>(ncpu_);
    }
    hostwatch::model::ProcSample ps;
    ps.pid = pid; ps.name = std::move(comm); ps.total_time = total_proc;
    ps.rss_kb = rssp > 0 ? static_cast<uint64_t>(rssp) * static_cast<uint64_t>(page_kb) : 0;
    ps.cpu_pct = cpu_pct;
    ps.mem_pct = mem_total_kb > 0 ? 100.0 * static_cast<double>(ps.rss_kb) / static_cast<double>(mem_total_kb) : 0.0;
    out.processes.push_back(std::move(ps));
  }
  out.total_processes = out.processes.size();
  std::stable_sort(out.processes.begin(), out.processes.end(),
                   [](const auto& a, const auto& b){ return a.cpu_pct > b.cpu_pct; });
  if (out.processes.size() > top_n_) out.processes.resize(top_n_);

  last_per_proc_ = std::move(seen);
  last_cpu_total_ = cpu_total; have_last_ = true;
  return true;
}

bool ProcessCollector::measure(hostwatch::model::ProcessSnapshot& out, std::chrono::milliseconds window,
                               std::stop_token st) {
  have_last_ = false;
  hostwatch::model::ProcessSnapshot primed{};
  if (!sample(primed, st)) return false;
  if (!hostwatch::util::wait_or_stop(st, window)) return false;
  return sample(out, st);
}

} // namespace hostwatch::collectors
