#include "minitest.hpp"
#include "collectors/FsCollector.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// 4 KiB blocks; sizes chosen so used_pct is exact
static int fake_statvfs(const char* path, struct statvfs* out) {
  std::memset(out, 0, sizeof(*out));
  out->f_bsize = 4096; out->f_frsize = 4096;
  std::string p(path);
  if (p == "/") {            // 100 GiB, 97% used, no reserved blocks
    out->f_blocks = 26214400; out->f_bfree = 786432; out->f_bavail = 786432;
  } else if (p == "/data") { // 10 GiB, 60% used
    out->f_blocks = 2621440; out->f_bfree = 1048576; out->f_bavail = 1048576;
  } else if (p == "/boot/efi") { // 512 MiB, below the 1 GB floor
    out->f_blocks = 131072; out->f_bfree = 65536; out->f_bavail = 65536;
  } else if (p == "/mnt/my disk") {
    out->f_blocks = 2621440; out->f_bfree = 2621440; out->f_bavail = 2621440;
  } else if (p == "/home") { // 10 GiB, 5% reserved for root
    out->f_blocks = 2621440; out->f_bfree = 1310720; out->f_bavail = 1179648;
  } else {
    errno = EACCES;
    return -1;
  }
  return 0;
}

static fs::path make_root_fs(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("hostwatch_test_fs_") + tag) / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/self");
  return root;
}

TEST(fs_collector_filters_and_measures) {
  auto root = make_root_fs("basic");
  std::ofstream(root / "proc/self/mounts") <<
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "proc /proc proc rw 0 0\n"
    "tmpfs /run tmpfs rw 0 0\n"
    "/dev/sdb1 /data xfs rw 0 0\n"
    "/dev/sda2 /boot/efi vfat rw 0 0\n"
    "/dev/sdc1 /secret ext4 rw 0 0\n"
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "/dev/sdd1 /mnt/my\\040disk ext4 rw 0 0\n";
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::FsCollector c(&fake_statvfs);
  hostwatch::model::FsSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  // pseudo, too small, inaccessible and duplicate mounts are skipped
  ASSERT_EQ(s.mounts.size(), 3u);
  ASSERT_EQ(s.mounts[0].mountpoint, std::string("/"));
  ASSERT_EQ(s.mounts[0].device, std::string("/dev/sda1"));
  ASSERT_TRUE(s.mounts[0].used_pct > 96.9 && s.mounts[0].used_pct < 97.1);
  ASSERT_TRUE(s.mounts[0].total_gb() > 99.9 && s.mounts[0].total_gb() < 100.1);
  ASSERT_TRUE(s.mounts[0].free_gb() > 2.9 && s.mounts[0].free_gb() < 3.1);
  ASSERT_EQ(s.mounts[1].mountpoint, std::string("/data"));
  ASSERT_TRUE(s.mounts[1].used_pct > 59.9 && s.mounts[1].used_pct < 60.1);
  ASSERT_EQ(s.mounts[2].mountpoint, std::string("/mnt/my disk"));
  ASSERT_EQ(s.mounts[2].used_pct, 0.0);
  fs::remove_all(root);
}

TEST(fs_collector_reserved_blocks_excluded_from_pct) {
  auto root = make_root_fs("reserved");
  std::ofstream(root / "proc/self/mounts") << "/dev/sde1 /home ext4 rw 0 0\n";
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::FsCollector c(&fake_statvfs);
  hostwatch::model::FsSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.mounts.size(), 1u);
  // used 1310720 blocks, avail 1179648: 52.6% rather than 50%
  ASSERT_TRUE(s.mounts[0].used_pct > 52.5 && s.mounts[0].used_pct < 52.7);
  fs::remove_all(root);
}

TEST(fs_collector_missing_mount_table) {
  auto root = make_root_fs("nomounts");
  setenv("HOSTWATCH_PROC_ROOT", root.c_str(), 1);
  hostwatch::collectors::FsCollector c(&fake_statvfs);
  hostwatch::model::FsSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
  ASSERT_TRUE(s.mounts.empty());
  fs::remove_all(root);
}
