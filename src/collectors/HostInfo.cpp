#include "collectors/HostInfo.hpp"
#include "util/Procfs.hpp"

#include <sstream>
#include <unistd.h>

namespace hostwatch::collectors {

std::optional<HostInfo> read_host_info() {
  HostInfo info;
  bool any = false;
  if (auto h = hostwatch::util::read_first_line("/proc/sys/kernel/hostname"); h && !h->empty()) {
    info.hostname = *h; any = true;
  }
  if (auto v = hostwatch::util::read_first_line("/proc/sys/kernel/osrelease"); v && !v->empty()) {
    info.kernel_version = *v; any = true;
  }
  if (auto o = hostwatch::util::read_first_line("/proc/sys/kernel/ostype"); o && !o->empty()) {
    info.os = *o;
  }
  if (auto up = hostwatch::util::read_file_string("/proc/uptime")) {
    std::istringstream ss(*up);
    double secs = 0.0;
    if (ss >> secs) { info.uptime_hours = secs / 3600.0; any = true; }
  }
  if (!any) return std::nullopt;
  long n = ::sysconf(_SC_NPROCESSORS_ONLN);
  info.logical_cpus = n > 0 ? static_cast<int>(n) : 1;
  return info;
}

} // namespace hostwatch::collectors
