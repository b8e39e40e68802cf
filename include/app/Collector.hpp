#pragma once
#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "collectors/FsCollector.hpp"
#include "model/Snapshot.hpp"

namespace hostwatch::app {

// One failed hard probe (cpu or memory) for one collect() call.
struct ProbeError {
  std::string domain;
  std::string message;
};

struct CollectResult {
  hostwatch::model::Snapshot snapshot; // best effort, also on error
  std::vector<ProbeError> errors;
  bool ok() const { return errors.empty(); }
  // "cpu: cannot read /proc/stat; memory: timed out"
  [[nodiscard]] std::string error_text() const;
};

class ISnapshotSource {
public:
  virtual ~ISnapshotSource() = default;
  virtual CollectResult collect() = 0;
};

// Runs the cpu, memory, disk, load and process probes on their own threads
// and merges them into one snapshot. Every probe shares one deadline; a probe
// still running when it expires is asked to stop and left behind, so a hung
// syscall never blocks the caller past probe_timeout. A domain whose previous
// probe has not returned yet is not probed again; it is reported as timed out.
class Collector : public ISnapshotSource {
public:
  explicit Collector(const MonitorConfig& cfg,
                     hostwatch::collectors::FsCollector::StatFn stat_fn = &::statvfs);

  CollectResult collect() override;

  // No probe from an earlier collect() is still running
  [[nodiscard]] bool idle() const;

  static constexpr int kProbeCount = 5;

private:
  std::chrono::milliseconds window_;
  std::chrono::milliseconds timeout_;
  size_t top_n_;
  hostwatch::collectors::FsCollector::StatFn stat_fn_;
  // one flag per probe domain, cleared by the probe thread when it returns
  std::array<std::shared_ptr<std::atomic<bool>>, kProbeCount> in_flight_;
};

} // namespace hostwatch::app
