#pragma once
#include <optional>
#include <string>

namespace hostwatch::collectors {

struct HostInfo {
  std::string hostname;
  std::string kernel_version;
  std::string os;           // from /proc/sys/kernel/ostype, e.g. Linux
  double uptime_hours{0.0};
  int logical_cpus{0};
};

// Reads host identity from /proc. Missing individual fields are left empty;
// std::nullopt means none of hostname, kernel release or uptime could be read.
[[nodiscard]] std::optional<HostInfo> read_host_info();

} // namespace hostwatch::collectors
