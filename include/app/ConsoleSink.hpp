#pragma once
#include <cstdio>
#include "app/Report.hpp"

namespace hostwatch::app {

// Human-readable cycle report on out, alerts and failures on err.
// quiet suppresses the report block only.
class ConsoleSink : public IReportSink {
public:
  explicit ConsoleSink(bool quiet = false, std::FILE* out = stdout, std::FILE* err = stderr);

  void report(const CycleReport& r) override;
  void actionable(const ActionItem& item) override;
  void collection_failed(int iteration, const std::vector<ProbeError>& errors) override;
  void finished(const RunSummary& summary) override;

private:
  bool quiet_;
  std::FILE* out_;
  std::FILE* err_;
};

} // namespace hostwatch::app
