#pragma once

namespace hostwatch::model {

// Kernel run-queue load averages. Best effort: has_load is false when
// /proc/loadavg could not be read and the values stay zero.
struct LoadAvg {
  bool   has_load{false};
  double load1{};
  double load5{};
  double load15{};
};

} // namespace hostwatch::model
