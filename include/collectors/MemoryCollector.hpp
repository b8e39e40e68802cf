#pragma once
#include <string>
#include "model/Snapshot.hpp"

namespace hostwatch::collectors {

class MemoryCollector {
public:
  bool sample(hostwatch::model::Memory& out); // returns true on success
  [[nodiscard]] const std::string& last_error() const { return error_; }
private:
  std::string error_{};
};

} // namespace hostwatch::collectors
