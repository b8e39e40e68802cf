#include "app/Config.hpp"
#include "util/Format.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>

namespace hostwatch::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTWATCH_", 0) == 0) {
    alt = std::string("hostwatch_") + n.substr(10);
  } else if (n.rfind("hostwatch_", 0) == 0) {
    alt = std::string("HOSTWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stod(v); } catch(...) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostwatch/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const hostwatch::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const hostwatch::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const hostwatch::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const hostwatch::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

ConfigLoad load_config(const std::string& explicit_path) {
  ConfigLoad out;
  MonitorConfig& c = out.config;
  const MonitorConfig d{};

  hostwatch::util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    have_toml = toml.load(explicit_path);
    if (!have_toml) out.errors.push_back("cannot read config file " + explicit_path);
    else out.source = explicit_path;
  } else {
    auto path = config_file_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
      have_toml = toml.load(path);
      if (!have_toml) out.errors.push_back("cannot read config file " + path);
      else out.source = path;
    }
  }

  // --- [monitor] ---
  c.cpu_threshold     = resolve_double(toml, have_toml, "monitor", "cpu_threshold",     "HOSTWATCH_CPU_THRESHOLD",     d.cpu_threshold);
  c.memory_threshold  = resolve_double(toml, have_toml, "monitor", "memory_threshold",  "HOSTWATCH_MEMORY_THRESHOLD",  d.memory_threshold);
  c.disk_threshold    = resolve_double(toml, have_toml, "monitor", "disk_threshold",    "HOSTWATCH_DISK_THRESHOLD",    d.disk_threshold);
  c.top_process_count = resolve_int(toml, have_toml, "monitor", "top_process_count",    "HOSTWATCH_TOP_PROCESS_COUNT", d.top_process_count);
  c.interval_seconds  = resolve_int(toml, have_toml, "monitor", "interval_seconds",     "HOSTWATCH_INTERVAL",          d.interval_seconds);
  c.run_once          = resolve_bool(toml, have_toml, "monitor", "run_once",            "HOSTWATCH_RUN_ONCE",          d.run_once);
  c.max_iterations    = resolve_int(toml, have_toml, "monitor", "max_iterations",       "HOSTWATCH_MAX_ITERATIONS",    d.max_iterations);
  c.exclude_current_from_baseline =
      resolve_bool(toml, have_toml, "monitor", "exclude_current_from_baseline", "HOSTWATCH_EXCLUDE_CURRENT", d.exclude_current_from_baseline);

  // --- [collector] ---
  c.sample_window_ms = resolve_int(toml, have_toml, "collector", "sample_window_ms", "HOSTWATCH_SAMPLE_WINDOW_MS", d.sample_window_ms);
  c.probe_timeout_ms = resolve_int(toml, have_toml, "collector", "probe_timeout_ms", "HOSTWATCH_PROBE_TIMEOUT_MS", d.probe_timeout_ms);

  // --- [output] ---
  c.log_dir      = resolve_string(toml, have_toml, "output", "log_dir",      "HOSTWATCH_LOG_DIR",      d.log_dir);
  c.metrics_port = resolve_int(toml, have_toml, "output", "metrics_port",    "HOSTWATCH_METRICS_PORT", d.metrics_port);
  c.quiet        = resolve_bool(toml, have_toml, "output", "quiet",          "HOSTWATCH_QUIET",        d.quiet);
  return out;
}

std::vector<std::string> validate_config(const MonitorConfig& c) {
  using hostwatch::util::strprintf;
  std::vector<std::string> errs;
  auto pct_ok = [](double v){ return v > 0.0 && v <= 100.0; };
  if (!pct_ok(c.cpu_threshold))    errs.push_back(strprintf("cpu_threshold %.1f outside (0, 100]", c.cpu_threshold));
  if (!pct_ok(c.memory_threshold)) errs.push_back(strprintf("memory_threshold %.1f outside (0, 100]", c.memory_threshold));
  if (!pct_ok(c.disk_threshold))   errs.push_back(strprintf("disk_threshold %.1f outside (0, 100]", c.disk_threshold));
  if (c.top_process_count < 1)     errs.push_back(strprintf("top_process_count %d must be at least 1", c.top_process_count));
  if (c.interval_seconds < 1)      errs.push_back(strprintf("interval_seconds %d must be at least 1", c.interval_seconds));
  if (c.max_iterations < 0)        errs.push_back(strprintf("max_iterations %d must not be negative", c.max_iterations));
  if (c.sample_window_ms < 10)     errs.push_back(strprintf("sample_window_ms %d must be at least 10", c.sample_window_ms));
  if (c.probe_timeout_ms <= c.sample_window_ms)
    errs.push_back(strprintf("probe_timeout_ms %d must exceed sample_window_ms %d", c.probe_timeout_ms, c.sample_window_ms));
  if (c.metrics_port < 0 || c.metrics_port > 65535)
    errs.push_back(strprintf("metrics_port %d outside 0..65535", c.metrics_port));
  return errs;
}

} // namespace hostwatch::app
