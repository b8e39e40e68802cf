#include "minitest.hpp"
#include "app/ConsoleSink.hpp"
#include <cstdio>
#include <string>

static std::string drain(std::FILE* f) {
  std::fflush(f);
  std::rewind(f);
  std::string out;
  char buf[512];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  std::fclose(f);
  return out;
}

static hostwatch::app::CycleReport sample_report() {
  hostwatch::app::CycleReport r{};
  r.iteration = 7;
  r.snapshot.cpu.usage_pct = 97.0;
  r.snapshot.cpu.cores = 4;
  hostwatch::model::ProcSample p{};
  p.pid = 4242; p.name = "burner"; p.cpu_pct = 380.0; p.rss_kb = 2048;
  r.snapshot.procs.processes = {p};
  r.top_cpu = {p};
  r.top_memory = {p};
  hostwatch::model::Alert a{};
  a.level = hostwatch::model::AlertLevel::Critical;
  a.category = hostwatch::model::AlertCategory::Cpu;
  a.value = 97.0; a.threshold = 80.0;
  a.message = "CPU usage is 97.0% (threshold: 80.0%)";
  r.alerts = {a};
  r.recommendations = {"Consider terminating or optimizing high CPU process: burner (380.0% CPU)"};
  return r;
}

TEST(console_report_sections) {
  std::FILE* out = std::tmpfile();
  std::FILE* err = std::tmpfile();
  ASSERT_TRUE(out && err);
  hostwatch::app::ConsoleSink sink(false, out, err);
  sink.report(sample_report());
  auto o = drain(out);
  auto e = drain(err);
  ASSERT_TRUE(o.find("=== hostwatch cycle 7 @ ") != std::string::npos);
  ASSERT_TRUE(o.find("(4 cores)") != std::string::npos);
  ASSERT_TRUE(o.find("Load    n/a") != std::string::npos);
  ASSERT_TRUE(o.find("burner") != std::string::npos);
  ASSERT_TRUE(o.find("  [critical] CPU usage is 97.0% (threshold: 80.0%)") != std::string::npos);
  ASSERT_TRUE(o.find("  - Consider terminating") != std::string::npos);
  ASSERT_EQ(e, std::string("hostwatch: alert: [critical] cpu value=97.0 threshold=80.0: "
                           "CPU usage is 97.0% (threshold: 80.0%)\n"));
}

TEST(console_quiet_keeps_alert_lines) {
  std::FILE* out = std::tmpfile();
  std::FILE* err = std::tmpfile();
  ASSERT_TRUE(out && err);
  hostwatch::app::ConsoleSink sink(true, out, err);
  sink.report(sample_report());
  hostwatch::app::RunSummary s{};
  s.iterations = 1;
  s.reason = "single cycle complete";
  sink.finished(s);
  auto o = drain(out);
  auto e = drain(err);
  ASSERT_TRUE(o.empty());
  ASSERT_TRUE(e.find("hostwatch: alert: [critical] cpu") != std::string::npos);
  ASSERT_TRUE(e.find("hostwatch: run success: 1 cycle, 0 failed") != std::string::npos);
  ASSERT_TRUE(e.find("(single cycle complete)") != std::string::npos);
}
