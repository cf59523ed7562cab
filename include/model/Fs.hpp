#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace skynode::model {

struct FsMount {
  std::string device;      // e.g., /dev/nvme0n1p2
  std::string mountpoint;  // e.g., /
  std::string fstype;      // e.g., ext4, xfs, btrfs
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  double   used_pct{};     // 0..100
};

struct FsSnapshot {
  std::vector<FsMount> mounts; // one entry per backing device
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  double   used_pct{};         // aggregate over all mounts
};

} // namespace skynode::model
