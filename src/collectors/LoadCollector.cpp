#include "collectors/LoadCollector.hpp"
#include "util/Procfs.hpp"

#include <sstream>

namespace hostwatch::collectors {

bool LoadCollector::sample(hostwatch::model::LoadAvg& out) const {
  out = hostwatch::model::LoadAvg{};
  auto txt = hostwatch::util::read_file_string("/proc/loadavg");
  if (!txt) return false;
  std::istringstream ss(*txt);
  double a1 = 0.0, a5 = 0.0, a15 = 0.0;
  if (!(ss >> a1 >> a5 >> a15)) return false;
  out.has_load = true;
  out.load1 = a1; out.load5 = a5; out.load15 = a15;
  return true;
}

} // namespace hostwatch::collectors
