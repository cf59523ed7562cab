#pragma once

#include <string>
#include <vector>

#include "model/Metric.hpp"
#include "util/Error.hpp"

namespace skynode::collectors {

struct Reading {
  std::string metric_name;
  double value{};
};

// One metric family's sensors. The sampler stamps and forwards what read() returns.
class ISensorSource {
public:
  virtual ~ISensorSource() = default;

  // Probe for the sensor. SensorUnavailable means the host does not have it
  // and the source is skipped for the rest of the run.
  [[nodiscard]] virtual util::Result<void> init() { return {}; }

  // Current values. SensorReadError is transient; SensorUnavailable means the
  // sensor went away.
  [[nodiscard]] virtual util::Result<std::vector<Reading>> read() = 0;

  [[nodiscard]] virtual const char* name() const = 0;
  [[nodiscard]] virtual model::MetricFamily family() const = 0;
};

} // namespace skynode::collectors
