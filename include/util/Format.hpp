#pragma once

#include <chrono>
#include <string>

namespace hostwatch::util {

// printf-style formatting into a std::string
std::string strprintf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// UTC ISO-8601 with millisecond precision, e.g. 2026-10-19T08:15:02.114Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Milliseconds since the Unix epoch
long long epoch_ms(std::chrono::system_clock::time_point tp);

// Human readable duration, e.g. "1h 02m 05s"
std::string format_duration(std::chrono::steady_clock::duration d);

} // namespace hostwatch::util
