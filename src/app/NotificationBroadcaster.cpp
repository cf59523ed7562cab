#include "app/NotificationBroadcaster.hpp"
#include "model/Json.hpp"

#include <algorithm>
#include <cstdio>
#include <thread>

namespace skynode::app {

NotificationBroadcaster::NotificationBroadcaster(PeerTransport& transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout) {}

BroadcastReport NotificationBroadcaster::broadcast(const model::AlertEvent& event,
                                                   const std::vector<model::Node>& peers,
                                                   const std::vector<std::string>& notify_nodes) {
  std::vector<const model::Node*> targets;
  for (const auto& p : peers) {
    if (p.status == model::NodeStatus::Offline) continue;
    if (!notify_nodes.empty() &&
        std::find(notify_nodes.begin(), notify_nodes.end(), p.id) == notify_nodes.end()) continue;
    targets.push_back(&p);
  }

  BroadcastReport report;
  report.attempted = targets.size();
  report.outcomes.resize(targets.size());
  if (targets.empty()) return report;

  const std::string body = model::write_compact(model::notification_to_json(event));
  {
    // each worker writes only its own slot; the jthreads join at scope exit
    std::vector<std::jthread> workers;
    workers.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
      workers.emplace_back([&, i]{
        const auto& peer = *targets[i];
        auto& out = report.outcomes[i];
        out.node_id = peer.id;
        out.node_name = peer.name;
        if (auto r = transport_.post_notification(peer, body, timeout_); !r) out.error = r.error();
      });
    }
  }

  for (const auto& o : report.outcomes) {
    if (!o.error) { ++report.delivered; continue; }
    ++report.failed;
    std::fprintf(stderr, "skynode: broadcast: %s (%s) not notified of '%s': %s: %s\n",
                 o.node_name.c_str(), o.node_id.c_str(), event.rule_id.c_str(),
                 util::errc_name(o.error->code), o.error->message.c_str());
  }
  return report;
}

} // namespace skynode::app
