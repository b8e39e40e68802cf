#pragma once
#include "model/Load.hpp"

namespace hostwatch::collectors {

class LoadCollector {
public:
  // Fills 1/5/15 minute averages from /proc/loadavg. On failure out is reset
  // to has_load=false and the call returns false.
  bool sample(hostwatch::model::LoadAvg& out) const;
};

} // namespace hostwatch::collectors
