#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include "util/Format.hpp"
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <ctime>

namespace hostwatch::app {

LogWriter::LogWriter(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "hostwatch: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  } else {
    std::fprintf(stderr, "hostwatch: LogWriter: writing to %s/\n", log_dir_.c_str());
  }
}

LogWriter::~LogWriter() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool LogWriter::open_chunk(std::chrono::system_clock::time_point tp) {
  auto required_path = chunk_path(tp);
  if (required_path == current_path_ && file_.is_open()) return true;

  // rotate on hour boundary
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
  file_.clear();
  file_.open(required_path, std::ios::app);
  if (!file_) {
    std::fprintf(stderr, "hostwatch: LogWriter: failed to open %s: %s\n",
                 required_path.c_str(), std::strerror(errno));
    current_path_.clear();
    return false;
  }
  current_path_ = required_path;
  return true;
}

void LogWriter::report(const CycleReport& r) {
  const auto tp = r.snapshot.timestamp;
  if (!open_chunk(tp)) return;

  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), hostwatch::util::epoch_ms(tp));

  constexpr std::string_view kTimestampPrefix = "# hostwatch_scrape_timestamp_ms ";
  file_.write(kTimestampPrefix.data(), static_cast<std::streamsize>(kTimestampPrefix.size()));
  file_.write(ts_buf, ptr - ts_buf);
  file_.put('\n');

  std::string body = cycle_to_prometheus(r);
  file_.write(body.data(), static_cast<std::streamsize>(body.size()));
  file_.flush();
  if (!file_) {
    std::fprintf(stderr, "hostwatch: LogWriter: write to %s failed\n", current_path_.c_str());
    file_.close();
    current_path_.clear();
  }
}

void LogWriter::append_actionable_line(const std::string& line) {
  std::ofstream f(actionable_path(), std::ios::app);
  if (!f) {
    std::fprintf(stderr, "hostwatch: LogWriter: failed to open %s: %s\n",
                 actionable_path().c_str(), std::strerror(errno));
    return;
  }
  f << line << '\n';
}

void LogWriter::actionable(const ActionItem& item) {
  using hostwatch::model::to_string;
  const auto& a = item.alert;
  append_actionable_line(hostwatch::util::strprintf(
      "%s cycle=%d level=%s category=%s value=%.1f threshold=%.1f %s",
      hostwatch::util::format_iso8601(a.timestamp).c_str(), item.iteration,
      to_string(a.level), to_string(a.category), a.value, a.threshold, item.title.c_str()));
}

void LogWriter::collection_failed(int iteration, const std::vector<ProbeError>& errors) {
  const auto now = std::chrono::system_clock::now();
  if (!open_chunk(now)) return;
  // comment lines keep the chunk valid exposition text
  for (const auto& e : errors) {
    file_ << "# hostwatch_collection_failed cycle=" << iteration
          << " domain=" << e.domain << " error=" << e.message << '\n';
  }
  file_.flush();
}

void LogWriter::finished(const RunSummary&) {
  if (file_.is_open()) file_.flush();
}

std::filesystem::path LogWriter::chunk_path(std::chrono::system_clock::time_point tp) const {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "hostwatch_%04d-%02d-%02d_%02d.prom",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
  return log_dir_ / buf;
}

} // namespace hostwatch::app
