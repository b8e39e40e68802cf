#include "collectors/FsCollector.hpp"
#include "util/Procfs.hpp"

#include <sstream>
#include <unordered_set>

namespace hostwatch::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","efivarfs","binfmt_misc","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

// The mount table escapes blanks in paths as \040 and friends
static std::string unescape_mount_field(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

bool FsCollector::sample(hostwatch::model::FsSnapshot& out, std::stop_token st) {
  out.mounts.clear();
  auto txt = hostwatch::util::read_file_string("/proc/self/mounts");
  if (!txt) return false;
  std::istringstream in(*txt);
  std::unordered_set<std::string> seen;
  std::string line;
  while (std::getline(in, line)) {
    if (st.stop_requested()) break;
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype)) continue;
    mountpoint = unescape_mount_field(mountpoint);
    if (!seen.insert(mountpoint).second) continue; // bind mounts and stacked mounts

    struct statvfs vfs{};
    if (stat_fn_(mountpoint.c_str(), &vfs) != 0) continue;
    uint64_t frsize = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * frsize;
    if (total < min_bytes) continue;
    uint64_t bfree = static_cast<uint64_t>(vfs.f_bfree) * frsize;
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * frsize;
    uint64_t used = (total > bfree) ? (total - bfree) : 0ULL;
    // df(1) semantics: blocks reserved for root count neither as used nor free
    double used_pct = (used + avail > 0) ? (100.0 * (double)used / (double)(used + avail)) : 0.0;

    hostwatch::model::FsMount m;
    m.device = unescape_mount_field(device);
    m.mountpoint = mountpoint;
    m.fstype = fstype;
    m.total_bytes = total;
    m.avail_bytes = avail;
    m.used_bytes = used;
    m.used_pct = used_pct;
    out.mounts.push_back(std::move(m));
  }
  return true;
}

} // namespace hostwatch::collectors
