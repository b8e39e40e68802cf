#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "app/Report.hpp"

namespace hostwatch::app {

// Serialize one cycle into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string cycle_to_prometheus(const CycleReport& r);

// GET /metrics endpoint serving the most recent cycle. Built on io_uring when
// liburing is available; otherwise start() only logs that it is unavailable.
class MetricsServer : public IReportSink {
public:
  explicit MetricsServer(uint16_t port);
  ~MetricsServer() override;
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

  void report(const CycleReport& r) override {
    std::string body = cycle_to_prometheus(r);
    std::lock_guard<std::mutex> lk(mu_);
    body_ = std::move(body);
  }
  void actionable(const ActionItem&) override {}
  void collection_failed(int, const std::vector<ProbeError>&) override {}
  void finished(const RunSummary&) override {}

  // Body served for /metrics; empty until the first cycle
  [[nodiscard]] std::string latest_body() const {
    std::lock_guard<std::mutex> lk(mu_);
    return body_;
  }

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  mutable std::mutex mu_;
  std::string body_;
  std::jthread thread_;
};

} // namespace hostwatch::app
