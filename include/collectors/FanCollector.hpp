#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Fan.hpp"

namespace skynode::collectors {

// Fan tachometers (hwmon fanN_input, RPM).
class FanCollector : public ISensorSource {
public:
  explicit FanCollector(long slow_rpm = 500) : slow_rpm_(slow_rpm) {}
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "fan"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Fan; }

  [[nodiscard]] util::Result<void> sample(model::FanSnapshot& out) const;

private:
  long slow_rpm_;
};

} // namespace skynode::collectors
