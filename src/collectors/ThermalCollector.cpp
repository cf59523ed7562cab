#include "collectors/ThermalCollector.hpp"
#include "util/Procfs.hpp"

#include <string>

namespace skynode::collectors {

enum class ChipClass { Cpu, Chipset, Disk, Gpu, Other };

static ChipClass classify(const std::string& chip) {
  if (chip == "coretemp" || chip == "k10temp" || chip == "zenpower" ||
      chip == "cpu_thermal" || chip == "cpu-thermal") return ChipClass::Cpu;
  if (chip.rfind("pch_", 0) == 0) return ChipClass::Chipset;
  if (chip == "nvme" || chip == "drivetemp") return ChipClass::Disk;
  if (chip == "amdgpu" || chip == "radeon" || chip == "nouveau" || chip == "i915" || chip == "xe")
    return ChipClass::Gpu;
  return ChipClass::Other;
}

static std::string trim(std::string s) {
  while (!s.empty() && (s.back()=='\n'||s.back()==' '||s.back()=='\r')) s.pop_back();
  return s;
}

static void keep_max(bool& has, double& cur, double c) {
  if (!has || c > cur) { has = true; cur = c; }
}

util::Result<void> ThermalCollector::init() {
  model::Thermal t;
  auto r = sample(t);
  if (!r) return util::fail(util::Errc::SensorUnavailable, r.error().message);
  return {};
}

util::Result<void> ThermalCollector::sample(model::Thermal& out) const {
  out = model::Thermal{};
  bool has_other = false; double other_c = 0.0;
  const std::string hw = "/sys/class/hwmon";
  for (const auto& dev : util::list_dir(hw)) {
    auto dir = hw + "/" + dev;
    auto chip = trim(util::read_file_string(dir + "/name").value_or(""));
    auto cls = classify(chip);
    if (cls == ChipClass::Gpu) continue; // reported by the GPU source
    for (const auto& file : util::list_dir(dir)) {
      if (file.rfind("temp", 0) != 0 || !file.ends_with("_input")) continue;
      auto mdeg = util::read_file_long(dir + "/" + file);
      if (!mdeg) continue;
      double c = static_cast<double>(*mdeg) / 1000.0;
      switch (cls) {
        case ChipClass::Cpu:     keep_max(out.has_cpu, out.cpu_c, c); break;
        case ChipClass::Chipset: keep_max(out.has_chipset, out.chipset_c, c); break;
        case ChipClass::Disk:    keep_max(out.has_disk, out.disk_max_c, c); break;
        default:                 keep_max(has_other, other_c, c); break;
      }
    }
  }
  if (!out.has_cpu) {
    const std::string tz = "/sys/class/thermal";
    for (const auto& zone : util::list_dir(tz)) {
      if (zone.rfind("thermal_zone", 0) != 0) continue;
      auto mdeg = util::read_file_long(tz + "/" + zone + "/temp");
      if (!mdeg) continue;
      keep_max(out.has_cpu, out.cpu_c, static_cast<double>(*mdeg) / 1000.0);
    }
  }
  if (!out.has_cpu && has_other) { out.has_cpu = true; out.cpu_c = other_c; }
  if (!out.has_cpu && !out.has_chipset && !out.has_disk)
    return util::fail(util::Errc::SensorReadError, "no temperature sensors under /sys/class/hwmon or /sys/class/thermal");
  return {};
}

util::Result<std::vector<Reading>> ThermalCollector::read() {
  model::Thermal t;
  if (auto r = sample(t); !r) return std::unexpected(r.error());
  std::vector<Reading> out;
  if (t.has_cpu) out.push_back({std::string(model::metric::kCpuTemperature), t.cpu_c});
  if (t.has_chipset) out.push_back({std::string(model::metric::kChipsetTemperature), t.chipset_c});
  if (t.has_disk) out.push_back({std::string(model::metric::kDiskMaxTemperature), t.disk_max_c});
  return out;
}

} // namespace skynode::collectors
