#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace hostwatch::util {

// Sleep for d unless stop is requested first. Returns false when woken by stop.
inline bool wait_or_stop(std::stop_token st, std::chrono::milliseconds d) {
  if (st.stop_requested()) return false;
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(mu);
  cv.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

} // namespace hostwatch::util
