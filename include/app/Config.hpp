#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>

#include "model/Metric.hpp"

namespace skynode::app {

struct AppConfig {
  // [node]
  std::string node_name;                      // empty: host name
  uint16_t api_port{3030};
  std::string bind_address{"0.0.0.0"};
  std::string data_dir;                       // empty: util::default_data_dir()

  // [sampler], indexed by model::MetricFamily
  std::array<std::chrono::milliseconds, 6> intervals{
    std::chrono::milliseconds(1000),  // cpu
    std::chrono::milliseconds(1000),  // memory
    std::chrono::milliseconds(5000),  // disk
    std::chrono::milliseconds(2000),  // temperature
    std::chrono::milliseconds(2000),  // gpu
    std::chrono::milliseconds(2000),  // fan
  };
  std::array<bool, 6> enabled{true, true, true, true, true, true};

  // [timeseries]
  std::chrono::seconds retention{86400};

  // [history]
  size_t history_max_records{1000};

  // [discovery]
  bool discovery_enabled{true};
  uint16_t udp_port{3031};
  std::chrono::milliseconds discovery_interval{5000};
  std::chrono::seconds liveness_timeout{30};
  std::chrono::seconds expire_after{3600};

  // [broadcast]
  std::chrono::milliseconds broadcast_timeout{3000};

  // [sensors]
  int fan_slow_rpm{500};

  [[nodiscard]] std::chrono::milliseconds interval_of(model::MetricFamily f) const {
    return intervals[static_cast<size_t>(f)];
  }
  [[nodiscard]] bool is_enabled(model::MetricFamily f) const { return enabled[static_cast<size_t>(f)]; }
};

// TOML file -> SKYNODE_* environment -> compiled default, per key. A missing
// file is not an error. Out-of-range values are clamped with a warning.
[[nodiscard]] AppConfig load_config(const std::string& path);

} // namespace skynode::app
