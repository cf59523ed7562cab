#include "collectors/FanCollector.hpp"
#include "util/Procfs.hpp"

#include <string>

namespace skynode::collectors {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back()=='\n'||s.back()==' '||s.back()=='\r')) s.pop_back();
  return s;
}

util::Result<void> FanCollector::init() {
  model::FanSnapshot s;
  auto r = sample(s);
  if (!r) return util::fail(util::Errc::SensorUnavailable, r.error().message);
  return {};
}

util::Result<void> FanCollector::sample(model::FanSnapshot& out) const {
  out = model::FanSnapshot{};
  const std::string hw = "/sys/class/hwmon";
  for (const auto& dev : util::list_dir(hw)) {
    auto dir = hw + "/" + dev;
    auto chip = trim(util::read_file_string(dir + "/name").value_or(dev));
    for (const auto& file : util::list_dir(dir)) {
      if (file.rfind("fan", 0) != 0 || !file.ends_with("_input")) continue;
      auto rpm = util::read_file_long(dir + "/" + file);
      if (!rpm) continue;
      auto base = file.substr(0, file.size() - 6); // strip "_input"
      auto label = trim(util::read_file_string(dir + "/" + base + "_label").value_or(""));
      if (label.empty()) label = chip + "/" + base;
      out.fans.push_back(model::FanReading{label, *rpm});
      ++out.total;
      if (*rpm <= 0) ++out.stopped;
      else if (*rpm < slow_rpm_) ++out.slow;
    }
  }
  if (out.total == 0) return util::fail(util::Errc::SensorReadError, "no fan tachometers under /sys/class/hwmon");
  return {};
}

util::Result<std::vector<Reading>> FanCollector::read() {
  model::FanSnapshot s;
  if (auto r = sample(s); !r) return std::unexpected(r.error());
  return std::vector<Reading>{
    {std::string(model::metric::kFansTotal), static_cast<double>(s.total)},
    {std::string(model::metric::kFansStopped), static_cast<double>(s.stopped)},
    {std::string(model::metric::kFansSlow), static_cast<double>(s.slow)},
  };
}

} // namespace skynode::collectors
