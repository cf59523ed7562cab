#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Fs.hpp"

namespace skynode::collectors {

// Disk usage aggregated over mounted, user-visible filesystems.
class FsCollector : public ISensorSource {
public:
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "disk"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Disk; }

  [[nodiscard]] util::Result<void> sample(model::FsSnapshot& out) const;
};

} // namespace skynode::collectors
