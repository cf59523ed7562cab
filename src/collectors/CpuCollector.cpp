#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

namespace skynode::collectors {

static void parse_cpu_line(std::string_view line, model::CpuTimes& out) {
  // skip the "cpu" / "cpuN" label
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      vals[i++] = std::strtoull(std::string(rest.substr(start, end - start)).c_str(), nullptr, 10);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

util::Result<void> CpuCollector::init() {
  if (!util::read_file_string("/proc/stat"))
    return util::fail(util::Errc::SensorUnavailable, "/proc/stat is not readable");
  // prime the delta so the first read() reports a real value
  model::CpuSnapshot s;
  return sample(s);
}

util::Result<void> CpuCollector::sample(model::CpuSnapshot& out) {
  auto txt_opt = util::read_file_string("/proc/stat");
  if (!txt_opt) return util::fail(util::Errc::SensorReadError, "cannot read /proc/stat");
  const std::string& txt = *txt_opt;
  model::CpuTimes agg{};
  bool have_agg = false;
  int cores = 0;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); have_agg = true; }
    else if (have_agg && line.starts_with("cpu")) ++cores;
    else if (have_agg) break;
    start = end + 1;
  }
  if (!have_agg || agg.total() == 0)
    return util::fail(util::Errc::SensorReadError, "/proc/stat has no aggregate cpu line");

  double usage = 0.0;
  if (has_last_) {
    auto td = agg.total() - last_.total();
    auto wd = agg.work()  - last_.work();
    // counters can step backwards after a CPU is hot-unplugged
    if (agg.total() >= last_.total() && agg.work() >= last_.work() && td > 0)
      usage = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  }
  last_ = agg; has_last_ = true;
  out.times = agg;
  out.usage_pct = usage > 100.0 ? 100.0 : usage;
  out.logical_threads = cores > 0 ? cores : 1;
  return {};
}

util::Result<std::vector<Reading>> CpuCollector::read() {
  model::CpuSnapshot s;
  if (auto r = sample(s); !r) return std::unexpected(r.error());
  return std::vector<Reading>{{std::string(model::metric::kCpuUsage), s.usage_pct}};
}

} // namespace skynode::collectors
