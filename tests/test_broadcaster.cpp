#include "minitest.hpp"
#include "app/NotificationBroadcaster.hpp"
#include "model/Json.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace skynode;
using namespace std::chrono_literals;

namespace {

// Delivers to every peer except the ones listed as slow, which time out.
class FakeTransport : public app::PeerTransport {
public:
  std::vector<std::string> slow;
  std::chrono::milliseconds delay{0};

  util::Result<void> post_notification(const model::Node& peer, const std::string& body,
                                       std::chrono::milliseconds timeout) override {
    {
      std::scoped_lock lk(mu);
      calls.push_back(peer.id);
      bodies.push_back(body);
    }
    for (const auto& id : slow) {
      if (id == peer.id) {
        std::this_thread::sleep_for(timeout);
        return util::fail(util::Errc::PeerTimeout, "timed out");
      }
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    return {};
  }

  std::mutex mu;
  std::vector<std::string> calls;
  std::vector<std::string> bodies;
};

model::Node peer(const char* id, model::NodeStatus status = model::NodeStatus::Online) {
  model::Node n;
  n.id = id;
  n.name = id;
  n.ip_address = "127.0.0.1";
  n.api_port = 3030;
  n.status = status;
  return n;
}

model::AlertEvent event() {
  model::AlertEvent e;
  e.rule_id = "cpu_critical";
  e.rule_name = "CPU Critical";
  e.severity = model::Severity::Critical;
  e.message = "CPU Critical: cpu_usage 99.0% > 95.0%";
  e.source_node_id = "node-a";
  e.source_node_name = "alpha";
  e.timestamp = util::from_epoch_ms(1'700'000'000'000LL);
  return e;
}

} // namespace

TEST(broadcast_reports_per_peer_outcomes) {
  FakeTransport tx;
  tx.slow = {"b"};
  app::NotificationBroadcaster bc(tx, 200ms);
  auto report = bc.broadcast(event(), {peer("b"), peer("c"), peer("d", model::NodeStatus::Offline)});
  ASSERT_EQ(report.attempted, 2u);
  ASSERT_EQ(report.delivered, 1u);
  ASSERT_EQ(report.failed, 1u);
  ASSERT_EQ(report.outcomes.size(), 2u);
  ASSERT_EQ(report.outcomes[0].node_id, std::string("b"));
  ASSERT_TRUE(report.outcomes[0].error.has_value());
  ASSERT_TRUE(report.outcomes[0].error->code == util::Errc::PeerTimeout);
  ASSERT_EQ(report.outcomes[1].node_id, std::string("c"));
  ASSERT_TRUE(!report.outcomes[1].error.has_value());
  ASSERT_EQ(tx.calls.size(), 2u);
}

TEST(broadcast_three_live_peers_one_times_out) {
  FakeTransport tx;
  tx.slow = {"B"};
  app::NotificationBroadcaster bc(tx, 200ms);
  auto report = bc.broadcast(event(), {peer("A"), peer("B"), peer("C")});
  ASSERT_EQ(report.attempted, 3u);
  ASSERT_EQ(report.delivered, 2u);
  ASSERT_EQ(report.failed, 1u);
  ASSERT_EQ(report.outcomes.size(), 3u);
  ASSERT_TRUE(!report.outcomes[0].error.has_value());
  ASSERT_EQ(report.outcomes[1].node_id, std::string("B"));
  ASSERT_TRUE(report.outcomes[1].error->code == util::Errc::PeerTimeout);
  ASSERT_TRUE(!report.outcomes[2].error.has_value());
}

TEST(broadcast_body_is_notification_json) {
  FakeTransport tx;
  app::NotificationBroadcaster bc(tx, 200ms);
  bc.broadcast(event(), {peer("b")});
  ASSERT_EQ(tx.bodies.size(), 1u);
  auto parsed = model::parse_json(tx.bodies[0]);
  ASSERT_TRUE(parsed.has_value());
  auto back = model::notification_from_json(*parsed);
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ(back->rule_id, std::string("cpu_critical"));
  ASSERT_EQ(back->source_node_id, std::string("node-a"));
  ASSERT_TRUE(back->severity == model::Severity::Critical);
}

TEST(broadcast_notify_nodes_restricts_targets) {
  FakeTransport tx;
  app::NotificationBroadcaster bc(tx, 200ms);
  auto report = bc.broadcast(event(), {peer("b"), peer("c"), peer("d")}, {"c", "zzz"});
  ASSERT_EQ(report.attempted, 1u);
  ASSERT_EQ(tx.calls.size(), 1u);
  ASSERT_EQ(tx.calls[0], std::string("c"));
}

TEST(broadcast_without_peers_is_a_no_op) {
  FakeTransport tx;
  app::NotificationBroadcaster bc(tx, 200ms);
  auto report = bc.broadcast(event(), {});
  ASSERT_EQ(report.attempted, 0u);
  ASSERT_TRUE(tx.calls.empty());
}

TEST(broadcast_peers_are_notified_concurrently) {
  FakeTransport tx;
  tx.delay = 300ms;
  app::NotificationBroadcaster bc(tx, 1000ms);
  std::vector<model::Node> peers{peer("b"), peer("c"), peer("d"), peer("e")};
  auto start = std::chrono::steady_clock::now();
  auto report = bc.broadcast(event(), peers);
  auto took = std::chrono::steady_clock::now() - start;
  ASSERT_EQ(report.delivered, 4u);
  ASSERT_TRUE(took < 1000ms);
}
