#include "collectors/FsCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace skynode::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","efivarfs","binfmt_misc","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

util::Result<void> FsCollector::init() {
  model::FsSnapshot s;
  auto r = sample(s);
  if (!r) return util::fail(util::Errc::SensorUnavailable, r.error().message);
  return {};
}

util::Result<void> FsCollector::sample(model::FsSnapshot& out) const {
  out = model::FsSnapshot{};
  auto txt = util::read_file_string("/proc/self/mounts");
  if (!txt) return util::fail(util::Errc::SensorReadError, "cannot read /proc/self/mounts");
  std::istringstream in(*txt);
  std::unordered_set<std::string> seen_devices;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype)) continue;
    // bind mounts and btrfs subvolumes share a device; count it once
    if (!seen_devices.insert(device).second) continue;

    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) continue;
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    if (total == 0) continue;
    uint64_t used = (total > avail) ? (total - avail) : 0ULL;

    model::FsMount m;
    m.device = device;
    m.mountpoint = mountpoint;
    m.fstype = fstype;
    m.total_bytes = total;
    m.used_bytes = used;
    m.used_pct = 100.0 * static_cast<double>(used) / static_cast<double>(total);
    out.total_bytes += total;
    out.used_bytes += used;
    out.mounts.push_back(std::move(m));
  }
  if (out.mounts.empty()) return util::fail(util::Errc::SensorReadError, "no disk-backed filesystems mounted");
  out.used_pct = 100.0 * static_cast<double>(out.used_bytes) / static_cast<double>(out.total_bytes);
  std::sort(out.mounts.begin(), out.mounts.end(), [](const auto& a, const auto& b){
    if (a.used_pct != b.used_pct) return a.used_pct > b.used_pct;
    return a.used_bytes > b.used_bytes;
  });
  return {};
}

util::Result<std::vector<Reading>> FsCollector::read() {
  model::FsSnapshot s;
  if (auto r = sample(s); !r) return std::unexpected(r.error());
  return std::vector<Reading>{{std::string(model::metric::kDiskUsagePercent), s.used_pct}};
}

} // namespace skynode::collectors
