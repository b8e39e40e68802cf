#include "minitest.hpp"
#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

static std::filesystem::path test_dir(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("hostwatch_logwriter_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream f(p);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// 2026-03-04 05:06:07 local time
static std::chrono::system_clock::time_point fixed_time() {
  std::tm tm{};
  tm.tm_year = 2026 - 1900; tm.tm_mon = 2; tm.tm_mday = 4;
  tm.tm_hour = 5; tm.tm_min = 6; tm.tm_sec = 7;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

TEST(logwriter_creates_directory) {
  auto dir = test_dir("mkdir");
  std::filesystem::remove_all(dir);
  ASSERT_TRUE(!std::filesystem::exists(dir));
  hostwatch::app::LogWriter writer(dir / "nested");
  ASSERT_TRUE(std::filesystem::is_directory(dir / "nested"));
  std::filesystem::remove_all(dir);
}

TEST(logwriter_chunk_path_is_hourly) {
  auto dir = test_dir("path");
  hostwatch::app::LogWriter writer(dir);
  auto tp = fixed_time();
  ASSERT_EQ(writer.chunk_path(tp).filename().string(), std::string("hostwatch_2026-03-04_05.prom"));
  ASSERT_EQ(writer.chunk_path(tp + std::chrono::minutes(30)), writer.chunk_path(tp));
  ASSERT_NE(writer.chunk_path(tp + std::chrono::hours(1)), writer.chunk_path(tp));
  std::filesystem::remove_all(dir);
}

TEST(logwriter_appends_cycles) {
  auto dir = test_dir("write");
  std::filesystem::remove_all(dir);
  hostwatch::app::CycleReport r{};
  r.snapshot.timestamp = fixed_time();
  r.snapshot.cpu.usage_pct = 12.5;
  {
    hostwatch::app::LogWriter writer(dir);
    r.iteration = 1;
    writer.report(r);
    r.iteration = 2;
    writer.report(r);
  }
  auto first = r;
  first.iteration = 1;
  auto text = slurp(dir / "hostwatch_2026-03-04_05.prom");
  const std::string ts_line = "# hostwatch_scrape_timestamp_ms " +
      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
          r.snapshot.timestamp.time_since_epoch()).count()) + "\n";
  ASSERT_TRUE(text.starts_with(ts_line));
  ASSERT_TRUE(text.find("hostwatch_cycle_iteration 1\n") != std::string::npos);
  ASSERT_TRUE(text.find("hostwatch_cycle_iteration 2\n") != std::string::npos);
  ASSERT_EQ(text, ts_line + hostwatch::app::cycle_to_prometheus(first) +
                  ts_line + hostwatch::app::cycle_to_prometheus(r));
  std::filesystem::remove_all(dir);
}

TEST(logwriter_actionable_line) {
  auto dir = test_dir("actionable");
  std::filesystem::remove_all(dir);
  hostwatch::app::LogWriter writer(dir);
  hostwatch::app::ActionItem item{};
  item.iteration = 4;
  item.alert.level = hostwatch::model::AlertLevel::Critical;
  item.alert.category = hostwatch::model::AlertCategory::Disk;
  item.alert.value = 97.0;
  item.alert.threshold = 90.0;
  item.alert.timestamp = fixed_time();
  item.title = "CRITICAL: Disk / usage is 97.0% (1.0 GB free)";
  writer.actionable(item);
  writer.actionable(item);

  std::ifstream f(writer.actionable_path());
  std::string line;
  int lines = 0;
  while (std::getline(f, line)) {
    ++lines;
    ASSERT_TRUE(line.find(" cycle=4 level=critical category=disk value=97.0 threshold=90.0 "
                          "CRITICAL: Disk / usage is 97.0% (1.0 GB free)") != std::string::npos);
    ASSERT_TRUE(line.starts_with("2026-03-0"));
  }
  ASSERT_EQ(lines, 2);
  std::filesystem::remove_all(dir);
}

TEST(logwriter_records_collection_failure) {
  auto dir = test_dir("failed");
  std::filesystem::remove_all(dir);
  std::filesystem::path chunk;
  {
    hostwatch::app::LogWriter writer(dir);
    writer.collection_failed(2, {{"cpu", "cannot read /proc/stat"}});
    chunk = writer.chunk_path(std::chrono::system_clock::now());
  }
  auto text = slurp(chunk);
  ASSERT_TRUE(text.find("# hostwatch_collection_failed cycle=2 domain=cpu error=cannot read /proc/stat\n")
              != std::string::npos);
  std::filesystem::remove_all(dir);
}
