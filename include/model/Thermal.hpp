#pragma once

namespace skynode::model {

// Hottest reading per hwmon chip class, degrees C.
struct Thermal {
  bool   has_cpu{false};
  double cpu_c{0.0};
  bool   has_chipset{false};
  double chipset_c{0.0};
  bool   has_disk{false};
  double disk_max_c{0.0};
};

} // namespace skynode::model
