#include "minitest.hpp"
#include "collectors/MemoryCollector.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

using namespace std;
namespace fs = std::filesystem;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("hostwatch_test_mem_") + tag) / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(memory_collector_parses_meminfo) {
  auto root = make_root("basic");
  ofstream(root / "proc/meminfo") <<
    "MemTotal:       2097152 kB\n"
    "MemFree:         524288 kB\n"
    "MemAvailable:   1048576 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n"
    "SwapTotal:      1048576 kB\n"
    "SwapFree:        786432 kB\n";
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::MemoryCollector c; hostwatch::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.total_kb, 2097152u);
  ASSERT_EQ(m.used_kb, 1048576u);
  ASSERT_TRUE(m.used_pct > 49.0 && m.used_pct < 51.0);
  ASSERT_EQ(m.swap_used_kb, 262144u);
  ASSERT_TRUE(m.swap_used_pct > 24.9 && m.swap_used_pct < 25.1);
  ASSERT_TRUE(m.total_gb() > 1.99 && m.total_gb() < 2.01);
  fs::remove_all(root);
}

TEST(memory_collector_without_memavailable) {
  auto root = make_root("legacy");
  ofstream(root / "proc/meminfo") <<
    "MemTotal:       1000000 kB\n"
    "MemFree:         200000 kB\n"
    "Buffers:         100000 kB\n"
    "Cached:          200000 kB\n";
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::MemoryCollector c; hostwatch::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.available_kb, 500000u);
  ASSERT_EQ(m.used_kb, 500000u);
  ASSERT_EQ(m.swap_used_pct, 0.0);
  fs::remove_all(root);
}

TEST(memory_collector_missing_total_is_error) {
  auto root = make_root("nototal");
  ofstream(root / "proc/meminfo") << "MemFree: 200000 kB\n";
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::MemoryCollector c; hostwatch::model::Memory m{};
  ASSERT_TRUE(!c.sample(m));
  ASSERT_EQ(c.last_error(), std::string("MemTotal missing from /proc/meminfo"));
  fs::remove(root / "proc/meminfo");
  ASSERT_TRUE(!c.sample(m));
  ASSERT_EQ(c.last_error(), std::string("cannot read /proc/meminfo"));
  fs::remove_all(root);
}
