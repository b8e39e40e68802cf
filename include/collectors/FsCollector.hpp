#pragma once
#include <stop_token>
#include <string>
#include <sys/statvfs.h>
#include "model/Fs.hpp"

namespace hostwatch::collectors {

class FsCollector {
public:
  using StatFn = int (*)(const char* path, struct statvfs* out);

  // stat_fn is the statvfs(3) replacement used by tests
  explicit FsCollector(StatFn stat_fn = &::statvfs) : stat_fn_(stat_fn) {}

  // Usage of every real partition of at least min_bytes. Mounts that cannot
  // be stat'ed are skipped. Returns false only if the mount table is unreadable.
  bool sample(hostwatch::model::FsSnapshot& out, std::stop_token st = {});

  static constexpr uint64_t min_bytes = 1024ULL * 1024ULL * 1024ULL;

private:
  StatFn stat_fn_;
};

} // namespace hostwatch::collectors
