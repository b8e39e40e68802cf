#include "minitest.hpp"
#include "collectors/ProcessCollector.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_proc(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("hostwatch_test_proc_") + tag) / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

static void write_stat(const fs::path& root, int pid, const std::string& comm,
                       unsigned long long utime, unsigned long long stime, long long rss_pages) {
  fs::create_directories(root / "proc" / std::to_string(pid));
  char buf[512];
  std::snprintf(buf, sizeof(buf),
                "%d (%s) S 1 %d %d 0 -1 4194304 100 0 0 0 %llu %llu 0 0 20 0 1 0 100 10485760 %lld 0 0 0\n",
                pid, comm.c_str(), pid, pid, utime, stime, rss_pages);
  std::ofstream(root / "proc" / std::to_string(pid) / "stat") << buf;
}

static void write_cpu(const fs::path& root, unsigned long long user, unsigned long long idle) {
  std::ofstream(root / "proc/stat") << "cpu  " << user << " 0 0 " << idle << " 0 0 0 0\n"
                                     << "cpu0 0 0 0 0 0 0 0 0\n"
                                     << "cpu1 0 0 0 0 0 0 0 0\n"
                                     << "intr 1\n";
}

TEST(process_collector_cpu_share_and_sort) {
  auto root = make_root_proc("share");
  std::ofstream(root / "proc/meminfo") << "MemTotal: 1024000 kB\n";
  write_cpu(root, 100, 900);
  write_stat(root, 10, "idle-ish", 10, 0, 256);
  write_stat(root, 20, "busy", 100, 0, 512);
  write_stat(root, 30, "my (weird) proc", 5, 5, 128);
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);

  hostwatch::collectors::ProcessCollector c(2);
  hostwatch::model::ProcessSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.total_processes, 3u);
  for (const auto& p : s.processes) ASSERT_EQ(p.cpu_pct, 0.0);

  // 100 jiffies of machine time pass on 2 cpus
  write_cpu(root, 150, 950);
  write_stat(root, 10, "idle-ish", 20, 0, 256);   // 10 jiffies -> 20%
  write_stat(root, 20, "busy", 150, 0, 512);      // 50 jiffies -> 100%
  write_stat(root, 30, "my (weird) proc", 10, 10, 128); // 10 jiffies -> 20%
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.total_processes, 3u);
  ASSERT_EQ(s.processes.size(), 2u); // truncated to top 2
  ASSERT_EQ(s.processes[0].pid, 20);
  ASSERT_EQ(s.processes[0].name, std::string("busy"));
  ASSERT_TRUE(s.processes[0].cpu_pct > 99.0 && s.processes[0].cpu_pct < 101.0);
  ASSERT_TRUE(s.processes[1].cpu_pct > 19.0 && s.processes[1].cpu_pct < 21.0);

  const long page_kb = ::sysconf(_SC_PAGESIZE) / 1024;
  ASSERT_EQ(s.processes[0].rss_kb, static_cast<uint64_t>(512 * page_kb));
  ASSERT_TRUE(s.processes[0].mem_pct > 0.0);
  fs::remove_all(root);
}

TEST(process_collector_skips_vanished_processes) {
  auto root = make_root_proc("vanish");
  std::ofstream(root / "proc/meminfo") << "MemTotal: 1024000 kB\n";
  write_cpu(root, 100, 900);
  write_stat(root, 41, "alive", 1, 1, 10);
  fs::create_directories(root / "proc/42");                  // exited: no stat file
  fs::create_directories(root / "proc/43");
  std::ofstream(root / "proc/43/stat") << "43 truncated";    // unparsable
  fs::create_directories(root / "proc/sys");                 // not a pid
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);

  hostwatch::collectors::ProcessCollector c(10);
  hostwatch::model::ProcessSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.total_processes, 1u);
  ASSERT_EQ(s.skipped_processes, 2u);
  ASSERT_EQ(s.processes.size(), 1u);
  ASSERT_EQ(s.processes[0].name, std::string("alive"));
  fs::remove_all(root);
}

TEST(process_collector_parenthesised_comm) {
  auto root = make_root_proc("comm");
  std::ofstream(root / "proc/meminfo") << "MemTotal: 1024000 kB\n";
  write_cpu(root, 100, 900);
  write_stat(root, 7, "a) b (c", 1, 1, 10);
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::ProcessCollector c(10);
  hostwatch::model::ProcessSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.processes.size(), 1u);
  ASSERT_EQ(s.processes[0].name, std::string("a) b (c"));
  ASSERT_EQ(s.processes[0].total_time, 2u);
  fs::remove_all(root);
}

TEST(process_collector_unlistable_proc) {
  setenv("HOSTWATCH_PROC_ROOT", "/nonexistent/hostwatch", 1);
  hostwatch::collectors::ProcessCollector c(10);
  hostwatch::model::ProcessSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
  ASSERT_TRUE(s.processes.empty());
}
