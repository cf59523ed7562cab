#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <string_view>

#include "util/Clock.hpp"

namespace skynode::model {

struct MetricSample {
  std::string metric_name;
  double value{};
  util::TimePoint timestamp{};
};

enum class MetricFamily { Cpu, Memory, Disk, Temperature, Gpu, Fan };

inline constexpr MetricFamily kAllFamilies[] = {
  MetricFamily::Cpu, MetricFamily::Memory, MetricFamily::Disk,
  MetricFamily::Temperature, MetricFamily::Gpu, MetricFamily::Fan,
};

[[nodiscard]] constexpr const char* to_string(MetricFamily f) {
  switch (f) {
    case MetricFamily::Cpu:         return "cpu";
    case MetricFamily::Memory:      return "memory";
    case MetricFamily::Disk:        return "disk";
    case MetricFamily::Temperature: return "temperature";
    case MetricFamily::Gpu:         return "gpu";
    case MetricFamily::Fan:         return "fan";
  }
  return "unknown";
}

[[nodiscard]] inline std::optional<MetricFamily> parse_family(std::string_view s) {
  for (auto f : kAllFamilies)
    if (s == to_string(f)) return f;
  return std::nullopt;
}

// Metric names produced by the built-in sensor sources.
namespace metric {
inline constexpr std::string_view kCpuUsage            = "cpu_usage";
inline constexpr std::string_view kMemoryUsagePercent  = "memory_usage_percent";
inline constexpr std::string_view kMemoryUsedGb        = "memory_used_gb";
inline constexpr std::string_view kSwapUsagePercent    = "swap_usage_percent";
inline constexpr std::string_view kDiskUsagePercent    = "disk_usage_percent";
inline constexpr std::string_view kCpuTemperature      = "cpu_temperature";
inline constexpr std::string_view kChipsetTemperature  = "chipset_temperature";
inline constexpr std::string_view kDiskMaxTemperature  = "disk_max_temperature";
inline constexpr std::string_view kGpuUsage            = "gpu_usage";
inline constexpr std::string_view kGpuMemoryPercent    = "gpu_memory_usage_percent";
inline constexpr std::string_view kGpuTemperature      = "gpu_temperature";
inline constexpr std::string_view kFansTotal           = "fans_total_count";
inline constexpr std::string_view kFansStopped         = "fans_stopped_count";
inline constexpr std::string_view kFansSlow            = "fans_slow_speed_count";
} // namespace metric

// Valid value range for a metric; thresholds of rules on that metric must fall inside it.
struct MetricDomain {
  double min;
  double max;
  const char* unit;
};

struct MetricInfo {
  std::string_view name;
  MetricFamily family;
  MetricDomain domain;
};

inline constexpr double kHuge = 1e12;

inline constexpr MetricInfo kMetricCatalog[] = {
  {metric::kCpuUsage,           MetricFamily::Cpu,         {0.0, 100.0, "%"}},
  {metric::kMemoryUsagePercent, MetricFamily::Memory,      {0.0, 100.0, "%"}},
  {metric::kMemoryUsedGb,       MetricFamily::Memory,      {0.0, kHuge, " GB"}},
  {metric::kSwapUsagePercent,   MetricFamily::Memory,      {0.0, 100.0, "%"}},
  {metric::kDiskUsagePercent,   MetricFamily::Disk,        {0.0, 100.0, "%"}},
  {metric::kCpuTemperature,     MetricFamily::Temperature, {-50.0, 200.0, "C"}},
  {metric::kChipsetTemperature, MetricFamily::Temperature, {-50.0, 200.0, "C"}},
  {metric::kDiskMaxTemperature, MetricFamily::Temperature, {-50.0, 200.0, "C"}},
  {metric::kGpuUsage,           MetricFamily::Gpu,         {0.0, 100.0, "%"}},
  {metric::kGpuMemoryPercent,   MetricFamily::Gpu,         {0.0, 100.0, "%"}},
  {metric::kGpuTemperature,     MetricFamily::Gpu,         {-50.0, 200.0, "C"}},
  {metric::kFansTotal,          MetricFamily::Fan,         {0.0, kHuge, ""}},
  {metric::kFansStopped,        MetricFamily::Fan,         {0.0, kHuge, ""}},
  {metric::kFansSlow,           MetricFamily::Fan,         {0.0, kHuge, ""}},
};

[[nodiscard]] inline const MetricInfo* find_metric(std::string_view name) {
  for (const auto& m : kMetricCatalog)
    if (m.name == name) return &m;
  return nullptr;
}

// Unknown metrics accept any finite value.
[[nodiscard]] inline bool in_domain(std::string_view name, double v) {
  if (!std::isfinite(v)) return false;
  const auto* m = find_metric(name);
  if (!m) return true;
  return v >= m->domain.min && v <= m->domain.max;
}

[[nodiscard]] inline const char* unit_of(std::string_view name) {
  const auto* m = find_metric(name);
  return m ? m->domain.unit : "";
}

} // namespace skynode::model
