#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "model/Alert.hpp"
#include "model/Node.hpp"
#include "util/Error.hpp"

namespace skynode::app {

// Delivery of one JSON notification to one peer's /alerts/notify.
// Implementations must give up after timeout and report PeerTimeout or
// PeerUnreachable.
class PeerTransport {
public:
  virtual ~PeerTransport() = default;
  [[nodiscard]] virtual util::Result<void> post_notification(const model::Node& peer, const std::string& body,
                                                             std::chrono::milliseconds timeout) = 0;
};

struct PeerOutcome {
  std::string node_id;
  std::string node_name;
  std::optional<util::Error> error;  // empty when delivered
};

struct BroadcastReport {
  size_t attempted{0};
  size_t delivered{0};
  size_t failed{0};
  std::vector<PeerOutcome> outcomes;  // same order as the targeted peers
};

// Fans an alert out to peers, one concurrent delivery per peer. A failing or
// slow peer never holds up the others; nothing is retried.
class NotificationBroadcaster {
public:
  NotificationBroadcaster(PeerTransport& transport, std::chrono::milliseconds timeout);

  // notify_nodes restricts the targets to the listed ids; empty means every peer given.
  BroadcastReport broadcast(const model::AlertEvent& event, const std::vector<model::Node>& peers,
                            const std::vector<std::string>& notify_nodes = {});

private:
  PeerTransport& transport_;
  std::chrono::milliseconds timeout_;
};

} // namespace skynode::app
