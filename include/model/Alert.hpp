#pragma once
#include <chrono>
#include <string>

namespace hostwatch::model {

enum class AlertLevel { Warning, Critical };
enum class AlertCategory { Cpu, Memory, Disk };

struct Alert {
  AlertLevel level{AlertLevel::Warning};
  AlertCategory category{AlertCategory::Cpu};
  std::string message;
  double value{};
  double threshold{};
  std::chrono::system_clock::time_point timestamp{};
};

inline const char* to_string(AlertLevel l) {
  return l == AlertLevel::Critical ? "critical" : "warning";
}

inline const char* to_string(AlertCategory c) {
  switch (c) {
    case AlertCategory::Cpu:    return "cpu";
    case AlertCategory::Memory: return "memory";
    case AlertCategory::Disk:   return "disk";
  }
  return "unknown";
}

} // namespace hostwatch::model
