#include "app/Collector.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/LoadCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/ProcessCollector.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <thread>

namespace hostwatch::app {

namespace {

enum Domain : int { kCpu = 0, kMemory, kDisk, kLoad, kProcess, kDomainCount };

constexpr const char* kDomainName[kDomainCount] = {"cpu", "memory", "disk", "load", "process"};
constexpr bool kHardDomain[kDomainCount] = {true, true, false, false, false};

// State of one collect() call. Shared with the probe threads so that a probe
// abandoned at the deadline can still finish safely.
struct Cycle {
  std::mutex mu;
  std::condition_variable cv;
  hostwatch::model::Snapshot snap;
  std::vector<ProbeError> errors;
  std::array<bool, kDomainCount> done{};
  int pending{kDomainCount};
  bool closed{false}; // deadline passed, late results are dropped
};

template <typename Apply>
void finish(Cycle& c, Domain d, bool ok, const std::string& err, Apply&& apply) {
  std::lock_guard<std::mutex> lk(c.mu);
  if (c.closed) return;
  if (ok) {
    apply(c.snap);
  } else if (kHardDomain[d]) {
    c.errors.push_back({kDomainName[d], err.empty() ? std::string("probe failed") : err});
  }
  c.done[d] = true;
  if (--c.pending == 0) c.cv.notify_one();
}

// Probe that never started because the previous one for its domain is still
// running. No notify: the caller's wait predicate sees pending reach zero.
void skip(Cycle& c, Domain d) {
  std::lock_guard<std::mutex> lk(c.mu);
  if (kHardDomain[d])
    c.errors.push_back({kDomainName[d], "timed out"});
  else
    std::fprintf(stderr, "hostwatch: collect: %s: previous probe still running, skipped\n", kDomainName[d]);
  c.done[d] = true;
  --c.pending;
}

struct InFlightGuard {
  std::shared_ptr<std::atomic<bool>> flag;
  ~InFlightGuard() { flag->store(false); }
};

static_assert(kDomainCount == Collector::kProbeCount);

} // namespace

std::string CollectResult::error_text() const {
  std::string out;
  for (const auto& e : errors) {
    if (!out.empty()) out += "; ";
    out += e.domain;
    out += ": ";
    out += e.message;
  }
  return out;
}

Collector::Collector(const MonitorConfig& cfg, hostwatch::collectors::FsCollector::StatFn stat_fn)
    : window_(cfg.sample_window()), timeout_(cfg.probe_timeout()),
      top_n_(static_cast<size_t>(cfg.top_process_count)), stat_fn_(stat_fn) {
  for (auto& f : in_flight_) f = std::make_shared<std::atomic<bool>>(false);
}

bool Collector::idle() const {
  for (const auto& f : in_flight_)
    if (f->load()) return false;
  return true;
}

CollectResult Collector::collect() {
  using namespace hostwatch::collectors;
  using hostwatch::model::Snapshot;

  auto cycle = std::make_shared<Cycle>();
  cycle->snap.timestamp = std::chrono::system_clock::now();
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  const auto window = window_;
  const auto top_n = top_n_;
  const auto stat_fn = stat_fn_;

  std::array<std::jthread, kDomainCount> probes;

  auto launch = [&](Domain d, auto body) {
    if (in_flight_[d]->load()) {
      skip(*cycle, d);
      return;
    }
    in_flight_[d]->store(true);
    probes[d] = std::jthread([cycle, flag = in_flight_[d], body = std::move(body)](std::stop_token st) {
      InFlightGuard guard{flag};
      body(*cycle, st);
    });
  };

  launch(kCpu, [window](Cycle& c, std::stop_token st) {
    CpuCollector cpu;
    hostwatch::model::CpuSnapshot out;
    bool ok = cpu.measure(out, window, st);
    finish(c, kCpu, ok, cpu.last_error(), [&](Snapshot& s) { s.cpu = std::move(out); });
  });

  launch(kMemory, [](Cycle& c, std::stop_token) {
    MemoryCollector mem;
    hostwatch::model::Memory out;
    bool ok = mem.sample(out);
    finish(c, kMemory, ok, mem.last_error(), [&](Snapshot& s) { s.mem = out; });
  });

  launch(kDisk, [stat_fn](Cycle& c, std::stop_token st) {
    FsCollector fs(stat_fn);
    hostwatch::model::FsSnapshot out;
    (void)fs.sample(out, st); // soft: an unreadable mount table yields no partitions
    finish(c, kDisk, true, {}, [&](Snapshot& s) { s.fs = std::move(out); });
  });

  launch(kLoad, [](Cycle& c, std::stop_token) {
    LoadCollector load;
    hostwatch::model::LoadAvg out;
    (void)load.sample(out); // soft: has_load stays false
    finish(c, kLoad, true, {}, [&](Snapshot& s) { s.load = out; });
  });

  launch(kProcess, [window, top_n](Cycle& c, std::stop_token st) {
    ProcessCollector procs(top_n);
    hostwatch::model::ProcessSnapshot out;
    (void)procs.measure(out, window, st); // soft
    finish(c, kProcess, true, {}, [&](Snapshot& s) { s.procs = std::move(out); });
  });

  CollectResult res;
  std::array<bool, kDomainCount> done{};
  {
    std::unique_lock<std::mutex> lk(cycle->mu);
    bool all = cycle->cv.wait_until(lk, deadline, [&] { return cycle->pending == 0; });
    if (!all) {
      cycle->closed = true;
      for (int d = 0; d < kDomainCount; ++d) {
        if (cycle->done[d]) continue;
        if (kHardDomain[d]) cycle->errors.push_back({kDomainName[d], "timed out"});
        else std::fprintf(stderr, "hostwatch: collect: %s: timed out, skipped\n", kDomainName[d]);
      }
    }
    done = cycle->done;
    res.snapshot = cycle->snap;
    res.errors = cycle->errors;
  }

  for (int d = 0; d < kDomainCount; ++d) {
    if (done[d]) continue;
    probes[d].request_stop();
    probes[d].detach();
  }
  // remaining jthreads join on destruction; they have already finished

  for (const auto& e : res.errors)
    std::fprintf(stderr, "hostwatch: collect: %s: %s\n", e.domain.c_str(), e.message.c_str());
  return res;
}

} // namespace hostwatch::app
