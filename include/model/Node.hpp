#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "util/Clock.hpp"

namespace skynode::model {

enum class NodeStatus { Online, Offline, Alerting };

[[nodiscard]] constexpr const char* to_string(NodeStatus s) {
  switch (s) {
    case NodeStatus::Online:   return "online";
    case NodeStatus::Offline:  return "offline";
    case NodeStatus::Alerting: return "alerting";
  }
  return "online";
}

[[nodiscard]] inline std::optional<NodeStatus> parse_node_status(std::string_view s) {
  if (s == "online") return NodeStatus::Online;
  if (s == "offline") return NodeStatus::Offline;
  if (s == "alerting") return NodeStatus::Alerting;
  return std::nullopt;
}

struct Node {
  std::string id;
  std::string name;
  std::string ip_address;
  uint16_t api_port{};
  std::string os_info;
  std::string version;
  NodeStatus status{NodeStatus::Online};
  util::TimePoint last_seen{};

  [[nodiscard]] std::string api_url() const {
    return "http://" + ip_address + ":" + std::to_string(api_port);
  }
};

} // namespace skynode::model
