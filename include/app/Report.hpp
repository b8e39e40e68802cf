#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "app/Collector.hpp"
#include "model/Alert.hpp"
#include "model/Snapshot.hpp"

namespace hostwatch::app {

// Everything one successful cycle produced.
struct CycleReport {
  int iteration{};
  hostwatch::model::Snapshot snapshot;
  std::vector<hostwatch::model::Alert> alerts;
  std::vector<std::string> recommendations;
  std::vector<hostwatch::model::ProcSample> top_cpu;    // top 5 by cpu
  std::vector<hostwatch::model::ProcSample> top_memory; // top 5 by rss
};

// A critical alert handed on separately so a sink can open a ticket for it.
struct ActionItem {
  int iteration{};
  std::string title;  // "CRITICAL: <alert message>"
  hostwatch::model::Alert alert;
};

enum class RunStatus { Success, Failed, Fatal };

inline const char* to_string(RunStatus s) {
  switch (s) {
    case RunStatus::Success: return "success";
    case RunStatus::Failed:  return "failed";
    case RunStatus::Fatal:   return "fatal";
  }
  return "unknown";
}

// Process exit code for a terminal status
inline int exit_code(RunStatus s) {
  switch (s) {
    case RunStatus::Success: return 0;
    case RunStatus::Failed:  return 1;
    case RunStatus::Fatal:   return 2;
  }
  return 2;
}

struct RunSummary {
  RunStatus status{RunStatus::Success};
  int iterations{};   // cycles attempted
  int failures{};     // cycles whose collection failed
  std::chrono::steady_clock::duration elapsed{};
  std::string reason; // why the run ended
};

class IReportSink {
public:
  virtual ~IReportSink() = default;
  virtual void report(const CycleReport& r) = 0;
  virtual void actionable(const ActionItem& item) = 0;
  virtual void collection_failed(int iteration, const std::vector<ProbeError>& errors) = 0;
  virtual void finished(const RunSummary& summary) = 0;
};

} // namespace hostwatch::app
