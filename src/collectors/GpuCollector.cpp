#include "collectors/GpuCollector.hpp"
#include "util/Procfs.hpp"

#include <sstream>
#include <string>

namespace skynode::collectors {

static std::string trim(std::string s) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!s.empty() && issp(s.front())) s.erase(s.begin());
  while (!s.empty() && issp(s.back())) s.pop_back();
  return s;
}

// "amdgpu (1002:73BF)" from DRIVER= and PCI_ID= in uevent
static std::string friendly_name(const std::string& dev, const std::string& fallback) {
  auto ue = util::read_file_string(dev + "/uevent");
  if (!ue) return fallback;
  std::istringstream in(*ue);
  std::string line, driver, pciid;
  while (std::getline(in, line)) {
    if (line.rfind("DRIVER=", 0) == 0) driver = trim(line.substr(7));
    else if (line.rfind("PCI_ID=", 0) == 0) pciid = trim(line.substr(7));
  }
  std::string out = driver;
  if (!pciid.empty()) out += (out.empty() ? "(" : " (") + pciid + ")";
  return out.empty() ? fallback : out;
}

// Edge sensor when labelled, else the first temperature input.
static bool read_hwmon_temp(const std::string& dev, double& out_c) {
  bool found = false;
  const std::string hw = dev + "/hwmon";
  for (const auto& hm : util::list_dir(hw)) {
    auto dir = hw + "/" + hm;
    for (const auto& file : util::list_dir(dir)) {
      if (file.rfind("temp", 0) != 0 || !file.ends_with("_input")) continue;
      auto mdeg = util::read_file_long(dir + "/" + file);
      if (!mdeg) continue;
      auto base = file.substr(0, file.size() - 6);
      auto label = trim(util::read_file_string(dir + "/" + base + "_label").value_or(""));
      if (label == "edge" || !found) {
        out_c = static_cast<double>(*mdeg) / 1000.0;
        found = true;
        if (label == "edge") return true;
      }
    }
  }
  return found;
}

util::Result<void> GpuCollector::init() {
  model::GpuSnapshot s;
  auto r = sample(s);
  if (!r) return util::fail(util::Errc::SensorUnavailable, r.error().message);
  return {};
}

util::Result<void> GpuCollector::sample(model::GpuSnapshot& out) const {
  out = model::GpuSnapshot{};
  const std::string drm = "/sys/class/drm";
  uint64_t vram_total = 0, vram_used = 0;
  for (const auto& card : util::list_dir(drm)) {
    // cardN only; connectors look like card0-DP-1
    if (!card.starts_with("card") || card.find('-') != std::string::npos) continue;
    auto dev = drm + "/" + card + "/device";
    model::GpuDevice rec;
    rec.name = friendly_name(dev, card);
    if (auto busy = util::read_file_long(dev + "/gpu_busy_percent")) {
      rec.has_busy = true;
      rec.busy_pct = static_cast<double>(*busy);
    }
    auto tot = util::read_file_long(dev + "/mem_info_vram_total");
    auto usd = util::read_file_long(dev + "/mem_info_vram_used");
    if (tot && usd && *tot > 0) {
      rec.vram_total_mb = static_cast<uint64_t>(*tot) / (1024ull * 1024ull);
      rec.vram_used_mb = static_cast<uint64_t>(*usd) / (1024ull * 1024ull);
      vram_total += static_cast<uint64_t>(*tot);
      vram_used += static_cast<uint64_t>(*usd);
    }
    double c = 0.0;
    if (read_hwmon_temp(dev, c)) { rec.has_temp = true; rec.temp_c = c; }
    if (!rec.has_busy && rec.vram_total_mb == 0 && !rec.has_temp) continue;

    if (rec.has_busy && (!out.has_busy || rec.busy_pct > out.busy_pct)) { out.has_busy = true; out.busy_pct = rec.busy_pct; }
    if (rec.has_temp && (!out.has_temp || rec.temp_c > out.temp_max_c)) { out.has_temp = true; out.temp_max_c = rec.temp_c; }
    out.devices.push_back(std::move(rec));
  }
  if (vram_total > 0) {
    out.has_vram = true;
    out.vram_used_pct = 100.0 * static_cast<double>(vram_used) / static_cast<double>(vram_total);
  }
  if (out.devices.empty()) return util::fail(util::Errc::SensorReadError, "no DRM device exposes busy, VRAM or temperature data");
  return {};
}

util::Result<std::vector<Reading>> GpuCollector::read() {
  model::GpuSnapshot s;
  if (auto r = sample(s); !r) return std::unexpected(r.error());
  std::vector<Reading> out;
  if (s.has_busy) out.push_back({std::string(model::metric::kGpuUsage), s.busy_pct});
  if (s.has_vram) out.push_back({std::string(model::metric::kGpuMemoryPercent), s.vram_used_pct});
  if (s.has_temp) out.push_back({std::string(model::metric::kGpuTemperature), s.temp_max_c});
  return out;
}

} // namespace skynode::collectors
