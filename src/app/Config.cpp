#include "app/Config.hpp"
#include "util/Env.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <string_view>
#include <vector>

namespace skynode::app {

using util::TomlReader;

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return util::getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return util::env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = util::getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static int clamp_warn(const char* key, int v, int lo, int hi) {
  if (v >= lo && v <= hi) return v;
  int c = std::clamp(v, lo, hi);
  std::fprintf(stderr, "skynode: config: %s=%d out of range [%d, %d], using %d\n", key, v, lo, hi, c);
  return c;
}

static std::vector<std::string> split_csv(std::string_view sv) {
  std::vector<std::string> out;
  while (!sv.empty()) {
    auto comma = sv.find(',');
    auto item = sv.substr(0, comma);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    sv.remove_prefix(comma + 1);
  }
  return out;
}

static void resolve_sources(const TomlReader& toml, bool have_toml, AppConfig& c) {
  std::vector<std::string> names;
  if (have_toml && toml.has("sampler", "enabled_sources")) {
    names = toml.get_list("sampler", "enabled_sources");
  } else if (const char* v = util::getenv_compat("SKYNODE_ENABLED_SOURCES")) {
    names = split_csv(v);
  } else {
    return;
  }
  c.enabled.fill(false);
  for (const auto& n : names) {
    if (auto f = model::parse_family(n)) c.enabled[static_cast<size_t>(*f)] = true;
    else std::fprintf(stderr, "skynode: config: unknown sensor source '%s' ignored\n", n.c_str());
  }
}

AppConfig load_config(const std::string& path) {
  AppConfig c;
  TomlReader toml;
  bool have_toml = false;
  if (!path.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      have_toml = toml.load(path);
      if (!have_toml) std::fprintf(stderr, "skynode: config: cannot read %s, using environment and defaults\n", path.c_str());
    }
  }

  c.node_name = resolve_string(toml, have_toml, "node", "name", "SKYNODE_NODE_NAME", c.node_name);
  c.api_port = static_cast<uint16_t>(clamp_warn("node.api_port",
      resolve_int(toml, have_toml, "node", "api_port", "SKYNODE_API_PORT", c.api_port), 0, 65535));
  c.bind_address = resolve_string(toml, have_toml, "node", "bind_address", "SKYNODE_BIND_ADDRESS", c.bind_address);
  c.data_dir = resolve_string(toml, have_toml, "node", "data_dir", "SKYNODE_DATA_DIR", c.data_dir);

  for (auto f : model::kAllFamilies) {
    std::string key = std::string(model::to_string(f)) + "_interval_ms";
    std::string env = "SKYNODE_" + key;
    for (auto& ch : env) if (ch >= 'a' && ch <= 'z') ch = static_cast<char>(ch - 'a' + 'A');
    auto& slot = c.intervals[static_cast<size_t>(f)];
    int ms = resolve_int(toml, have_toml, "sampler", key.c_str(), env.c_str(), static_cast<int>(slot.count()));
    std::string label = "sampler." + key;
    slot = std::chrono::milliseconds(clamp_warn(label.c_str(), ms, 100, 3'600'000));
  }
  resolve_sources(toml, have_toml, c);

  c.retention = std::chrono::seconds(clamp_warn("timeseries.retention_seconds",
      resolve_int(toml, have_toml, "timeseries", "retention_seconds", "SKYNODE_RETENTION_SECONDS",
                  static_cast<int>(c.retention.count())), 60, 30 * 86400));

  c.history_max_records = static_cast<size_t>(clamp_warn("history.max_records",
      resolve_int(toml, have_toml, "history", "max_records", "SKYNODE_HISTORY_MAX_RECORDS",
                  static_cast<int>(c.history_max_records)), 1, 1'000'000));

  c.discovery_enabled = resolve_bool(toml, have_toml, "discovery", "enabled", "SKYNODE_DISCOVERY", c.discovery_enabled);
  c.udp_port = static_cast<uint16_t>(clamp_warn("discovery.udp_port",
      resolve_int(toml, have_toml, "discovery", "udp_port", "SKYNODE_UDP_PORT", c.udp_port), 1, 65535));
  c.discovery_interval = std::chrono::milliseconds(clamp_warn("discovery.interval_ms",
      resolve_int(toml, have_toml, "discovery", "interval_ms", "SKYNODE_DISCOVERY_INTERVAL_MS",
                  static_cast<int>(c.discovery_interval.count())), 500, 600'000));
  c.liveness_timeout = std::chrono::seconds(clamp_warn("discovery.liveness_timeout_s",
      resolve_int(toml, have_toml, "discovery", "liveness_timeout_s", "SKYNODE_LIVENESS_TIMEOUT_S",
                  static_cast<int>(c.liveness_timeout.count())), 1, 86400));
  c.expire_after = std::chrono::seconds(clamp_warn("discovery.expire_after_s",
      resolve_int(toml, have_toml, "discovery", "expire_after_s", "SKYNODE_EXPIRE_AFTER_S",
                  static_cast<int>(c.expire_after.count())),
      static_cast<int>(c.liveness_timeout.count()), 30 * 86400));

  c.broadcast_timeout = std::chrono::milliseconds(clamp_warn("broadcast.timeout_ms",
      resolve_int(toml, have_toml, "broadcast", "timeout_ms", "SKYNODE_BROADCAST_TIMEOUT_MS",
                  static_cast<int>(c.broadcast_timeout.count())), 100, 60'000));

  c.fan_slow_rpm = clamp_warn("sensors.fan_slow_rpm",
      resolve_int(toml, have_toml, "sensors", "fan_slow_rpm", "SKYNODE_FAN_SLOW_RPM", c.fan_slow_rpm), 0, 100'000);

  return c;
}

} // namespace skynode::app
