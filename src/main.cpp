#include "app/Analyzer.hpp"
#include "app/Collector.hpp"
#include "app/Config.hpp"
#include "app/ConsoleSink.hpp"
#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include "app/Orchestrator.hpp"
#include "collectors/HostInfo.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout <<
    "Usage: hostwatch [options]\n"
    "  --config PATH           TOML config (default $XDG_CONFIG_HOME/hostwatch/config.toml)\n"
    "  --once                  one cycle, then exit (default)\n"
    "  --continuous            repeat every interval until SIGINT/SIGTERM\n"
    "  --interval S            seconds between cycles (default 30)\n"
    "  --iterations N          stop a continuous run after N cycles\n"
    "  --cpu-threshold P       cpu alert threshold percent (default 80)\n"
    "  --memory-threshold P    memory alert threshold percent (default 90)\n"
    "  --disk-threshold P      disk alert threshold percent (default 90)\n"
    "  --top N                 processes kept per snapshot (default 10)\n"
    "  --log-dir DIR           append Prometheus text logs to DIR\n"
    "  --metrics-port PORT     serve GET /metrics on PORT\n"
    "  --quiet                 no report on stdout\n"
    "  -h, --help              this text\n";
}

// Flags that take a value. Returns false on a malformed number.
static bool apply_flag(hostwatch::app::MonitorConfig& c, const std::string& a, const char* v) {
  try {
    if (a == "--interval") c.interval_seconds = std::stoi(v);
    else if (a == "--iterations") c.max_iterations = std::stoi(v);
    else if (a == "--cpu-threshold") c.cpu_threshold = std::stod(v);
    else if (a == "--memory-threshold") c.memory_threshold = std::stod(v);
    else if (a == "--disk-threshold") c.disk_threshold = std::stod(v);
    else if (a == "--top") c.top_process_count = std::stoi(v);
    else if (a == "--log-dir") c.log_dir = v;
    else if (a == "--metrics-port") c.metrics_port = std::stoi(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static bool takes_value(const std::string& a) {
  return a == "--config" || a == "--interval" || a == "--iterations" ||
         a == "--cpu-threshold" || a == "--memory-threshold" || a == "--disk-threshold" ||
         a == "--top" || a == "--log-dir" || a == "--metrics-port";
}

int main(int argc, char** argv) {
  using hostwatch::app::RunStatus;
  const int fatal = hostwatch::app::exit_code(RunStatus::Fatal);

  // First pass: --config and --help, so the file is loaded before flags apply
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { print_usage(); return 0; }
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (takes_value(a)) ++i;
  }

  auto loaded = hostwatch::app::load_config(config_path);
  for (const auto& e : loaded.errors) std::fprintf(stderr, "hostwatch: config: %s\n", e.c_str());
  if (!loaded.ok()) return fatal;
  hostwatch::app::MonitorConfig cfg = loaded.config;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config") {
      if (++i >= argc) { std::fprintf(stderr, "hostwatch: --config needs a value\n"); return fatal; }
      continue;
    }
    if (a == "--once") cfg.run_once = true;
    else if (a == "--continuous") cfg.run_once = false;
    else if (a == "--quiet") cfg.quiet = true;
    else if (takes_value(a)) {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "hostwatch: %s needs a value\n", a.c_str());
        return fatal;
      }
      const char* v = argv[++i];
      if (!apply_flag(cfg, a, v)) {
        std::fprintf(stderr, "hostwatch: invalid value for %s: %s\n", a.c_str(), v);
        return fatal;
      }
    } else {
      std::fprintf(stderr, "hostwatch: unknown option %s\n", a.c_str());
      print_usage();
      return fatal;
    }
  }

  auto problems = hostwatch::app::validate_config(cfg);
  for (const auto& p : problems) std::fprintf(stderr, "hostwatch: config: %s\n", p.c_str());
  if (!problems.empty()) return fatal;

  auto host = hostwatch::collectors::read_host_info();
  if (!host) {
    std::fprintf(stderr, "hostwatch: cannot read host information from /proc\n");
    return fatal;
  }
  std::fprintf(stderr, "hostwatch: host %s, %s %s, %d cpus, up %.1fh\n",
               host->hostname.c_str(), host->os.c_str(), host->kernel_version.c_str(),
               host->logical_cpus, host->uptime_hours);
  std::fprintf(stderr,
               "hostwatch: %s mode, interval %ds, thresholds cpu %.1f%% memory %.1f%% disk %.1f%%, top %d%s%s\n",
               cfg.run_once ? "single-shot" : "continuous", cfg.interval_seconds,
               cfg.cpu_threshold, cfg.memory_threshold, cfg.disk_threshold, cfg.top_process_count,
               loaded.source.empty() ? "" : ", config ", loaded.source.c_str());

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  hostwatch::app::ConsoleSink console(cfg.quiet);
  std::vector<hostwatch::app::IReportSink*> sinks{&console};
  std::unique_ptr<hostwatch::app::LogWriter> log_writer;
  if (!cfg.log_dir.empty()) {
    log_writer = std::make_unique<hostwatch::app::LogWriter>(cfg.log_dir);
    sinks.push_back(log_writer.get());
  }
  std::unique_ptr<hostwatch::app::MetricsServer> metrics;
  if (cfg.metrics_port > 0) {
    metrics = std::make_unique<hostwatch::app::MetricsServer>(static_cast<uint16_t>(cfg.metrics_port));
    metrics->start();
    sinks.push_back(metrics.get());
  }

  hostwatch::app::Collector collector(cfg);
  hostwatch::app::Analyzer analyzer(hostwatch::app::rules_from_config(cfg));
  hostwatch::app::Orchestrator orch(collector, analyzer, sinks,
                                    hostwatch::app::RunOptions::from_config(cfg));
  RunStatus status = orch.run(g_stop);

  if (metrics) metrics->stop();
  return hostwatch::app::exit_code(status);
}
