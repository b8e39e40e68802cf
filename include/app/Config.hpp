#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace hostwatch::app {

// Thresholds and run settings, fixed for the lifetime of a run.
struct MonitorConfig {
  // [monitor]
  double cpu_threshold{80.0};
  double memory_threshold{90.0};
  double disk_threshold{90.0};
  int    top_process_count{10};
  int    interval_seconds{30};
  bool   run_once{true};
  int    max_iterations{0};          // continuous mode only; 0 = until signalled
  bool   exclude_current_from_baseline{false};
  // [collector]
  int    sample_window_ms{1000};
  int    probe_timeout_ms{10000};
  // [output]
  std::string log_dir;               // empty = no file log
  int    metrics_port{0};            // 0 = no HTTP endpoint
  bool   quiet{false};

  std::chrono::milliseconds sample_window() const { return std::chrono::milliseconds(sample_window_ms); }
  std::chrono::milliseconds probe_timeout() const { return std::chrono::milliseconds(probe_timeout_ms); }
  std::chrono::seconds interval() const { return std::chrono::seconds(interval_seconds); }
};

struct ConfigLoad {
  MonitorConfig config;
  std::string source;               // file actually read, empty if none
  std::vector<std::string> errors;  // fatal configuration problems
  bool ok() const { return errors.empty(); }
};

// $XDG_CONFIG_HOME/hostwatch/config.toml or ~/.config/hostwatch/config.toml
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default. An empty explicit_path
// falls back to config_file_path() and tolerates its absence; an explicit
// path that cannot be read is an error. Values are not validated here.
ConfigLoad load_config(const std::string& explicit_path = {});

// Range checks. Each violation is one human-readable message.
std::vector<std::string> validate_config(const MonitorConfig& c);

// Environment helpers; accept both HOSTWATCH_X and hostwatch_X spellings
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);
bool env_flag(const char* name, bool defv);

} // namespace hostwatch::app
