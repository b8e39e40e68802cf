#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include "app/Report.hpp"

namespace hostwatch::app {

// Appends every cycle as a Prometheus text block to hourly chunks
// (hostwatch_YYYY-MM-DD_HH.prom, local time) and every actionable alert as
// one line to hostwatch_actionable.log. I/O failures are logged, never thrown.
class LogWriter : public IReportSink {
public:
  explicit LogWriter(std::filesystem::path log_dir);
  ~LogWriter() override;
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void report(const CycleReport& r) override;
  void actionable(const ActionItem& item) override;
  void collection_failed(int iteration, const std::vector<ProbeError>& errors) override;
  void finished(const RunSummary& summary) override;

  [[nodiscard]] std::filesystem::path chunk_path(std::chrono::system_clock::time_point tp) const;
  [[nodiscard]] std::filesystem::path actionable_path() const { return log_dir_ / "hostwatch_actionable.log"; }

private:
  bool open_chunk(std::chrono::system_clock::time_point tp);
  void append_actionable_line(const std::string& line);

  std::filesystem::path log_dir_;
  std::ofstream file_;
  std::filesystem::path current_path_;
};

} // namespace hostwatch::app
