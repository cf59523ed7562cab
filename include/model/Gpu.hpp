#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace skynode::model {

struct GpuDevice {
  std::string name;        // driver (PCI_ID) from uevent, else cardN
  bool     has_busy{false};
  double   busy_pct{};
  uint64_t vram_total_mb{};
  uint64_t vram_used_mb{};
  bool     has_temp{false};
  double   temp_c{};
};

struct GpuSnapshot {
  std::vector<GpuDevice> devices;
  bool   has_busy{false};
  double busy_pct{};        // busiest device
  bool   has_vram{false};
  double vram_used_pct{};   // summed over devices
  bool   has_temp{false};
  double temp_max_c{};
};

} // namespace skynode::model
