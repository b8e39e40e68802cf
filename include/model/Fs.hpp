#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostwatch::model {

inline constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

struct FsMount {
  std::string device;      // e.g., /dev/nvme0n1p2 or UUID=...
  std::string mountpoint;  // e.g., /
  std::string fstype;      // e.g., ext4, xfs, btrfs, f2fs
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  uint64_t avail_bytes{};
  double   used_pct{};     // 0..100

  double total_gb() const { return static_cast<double>(total_bytes) / kBytesPerGb; }
  double used_gb()  const { return static_cast<double>(used_bytes) / kBytesPerGb; }
  double free_gb()  const { return static_cast<double>(avail_bytes) / kBytesPerGb; }
};

struct FsSnapshot {
  std::vector<FsMount> mounts; // real partitions >= 1 GB, in mount table order
};

} // namespace hostwatch::model
