#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Thermal.hpp"

namespace skynode::collectors {

// hwmon temperatures classified by chip name: CPU package, PCH chipset, NVMe.
// Falls back to thermal zones for the CPU reading.
class ThermalCollector : public ISensorSource {
public:
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "temperature"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Temperature; }

  [[nodiscard]] util::Result<void> sample(model::Thermal& out) const;
};

} // namespace skynode::collectors
