#include "app/MetricsServer.hpp"
#include <cstdio>

namespace hostwatch::app {

MetricsServer::MetricsServer(uint16_t port) : port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  std::fprintf(stderr, "hostwatch: metrics endpoint :%d unavailable (built without liburing)\n", port_);
}

void MetricsServer::stop() {}

} // namespace hostwatch::app
