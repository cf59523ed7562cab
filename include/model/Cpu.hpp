#pragma once
#include <cstdint>

namespace skynode::model {

// Aggregate jiffies from the "cpu " line of /proc/stat
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  CpuTimes times{};
  double usage_pct{};  // aggregate percent 0..100 since the previous sample
  int logical_threads{0};
};

} // namespace skynode::model
