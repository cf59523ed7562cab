#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Gpu.hpp"

namespace skynode::collectors {

// Vendor-neutral GPU sensors from the DRM sysfs interface
// (/sys/class/drm/cardN/device: gpu_busy_percent, mem_info_vram_*, hwmon).
class GpuCollector : public ISensorSource {
public:
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "gpu"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Gpu; }

  [[nodiscard]] util::Result<void> sample(model::GpuSnapshot& out) const;
};

} // namespace skynode::collectors
