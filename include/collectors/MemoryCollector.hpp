#pragma once
#include "collectors/ISensorSource.hpp"
#include "model/Memory.hpp"

namespace skynode::collectors {

class MemoryCollector : public ISensorSource {
public:
  [[nodiscard]] util::Result<void> init() override;
  [[nodiscard]] util::Result<std::vector<Reading>> read() override;
  [[nodiscard]] const char* name() const override { return "memory"; }
  [[nodiscard]] model::MetricFamily family() const override { return model::MetricFamily::Memory; }

  [[nodiscard]] util::Result<void> sample(model::Memory& out) const;
};

} // namespace skynode::collectors
