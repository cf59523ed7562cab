#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Cpu.hpp"

namespace skynode::collectors {

class CpuCollector : public ISensorSource {
public:
  CpuCollector() = default;
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "cpu"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Cpu; }

  // Usage is the busy share of jiffies since the previous call; the first call reports 0.
  [[nodiscard]] util::Result<void> sample(model::CpuSnapshot& out);

private:
  model::CpuTimes last_{};
  bool has_last_{false};
};

} // namespace skynode::collectors
