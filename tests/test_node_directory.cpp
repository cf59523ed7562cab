#include "minitest.hpp"
#include "app/NodeDirectory.hpp"

#include <chrono>
#include <set>
#include <string>

using namespace skynode;
using namespace std::chrono_literals;

static const util::TimePoint t0 = util::from_epoch_ms(1'700'000'000'000LL);

static model::Node node(const char* id, const char* ip = "10.0.0.2") {
  model::Node n;
  n.id = id;
  n.name = std::string("host-") + id;
  n.ip_address = ip;
  n.api_port = 3030;
  return n;
}

TEST(directory_ignores_self) {
  app::NodeDirectory dir(node("self"));
  ASSERT_TRUE(!dir.upsert(node("self"), t0));
  ASSERT_TRUE(!dir.upsert(node(""), t0));
  ASSERT_EQ(dir.size(), 0u);
  ASSERT_TRUE(dir.upsert(node("b"), t0));
  ASSERT_EQ(dir.size(), 1u);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Online);
  ASSERT_TRUE(dir.find("b")->last_seen == t0);
}

TEST(directory_refresh_updates_address) {
  app::NodeDirectory dir(node("self"));
  dir.upsert(node("b", "10.0.0.2"), t0);
  dir.upsert(node("b", "10.0.0.9"), t0 + 5s);
  ASSERT_EQ(dir.size(), 1u);
  auto b = dir.find("b");
  ASSERT_EQ(b->ip_address, std::string("10.0.0.9"));
  ASSERT_EQ(b->api_url(), std::string("http://10.0.0.9:3030"));
  ASSERT_TRUE(b->last_seen == t0 + 5s);
}

TEST(directory_silent_peer_goes_offline_then_returns) {
  app::NodeDirectory dir(node("self"), app::DirectoryOptions{30s, 3600s});
  dir.upsert(node("b"), t0);
  auto r1 = dir.sweep(t0 + 29s);
  ASSERT_EQ(r1.marked_offline, 0u);
  auto r2 = dir.sweep(t0 + 31s);
  ASSERT_EQ(r2.marked_offline, 1u);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Offline);
  ASSERT_TRUE(dir.live_peers().empty());
  ASSERT_EQ(dir.peers().size(), 1u);
  // already offline, not counted again
  ASSERT_EQ(dir.sweep(t0 + 40s).marked_offline, 0u);

  dir.upsert(node("b"), t0 + 45s);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Online);
  ASSERT_EQ(dir.live_peers().size(), 1u);
}

TEST(directory_expires_long_silent_peers) {
  app::NodeDirectory dir(node("self"), app::DirectoryOptions{30s, 600s});
  dir.upsert(node("b"), t0);
  dir.upsert(node("c"), t0 + 500s);
  auto r = dir.sweep(t0 + 601s);
  ASSERT_EQ(r.expired, 1u);
  ASSERT_TRUE(!dir.find("b").has_value());
  ASSERT_TRUE(dir.find("c").has_value());
}

TEST(directory_alerting_follows_the_history_query) {
  std::set<std::string, std::less<>> severe;
  app::NodeDirectory dir(node("self"), app::DirectoryOptions{30s, 3600s},
                         [&](std::string_view id) { return severe.contains(id); });
  dir.upsert(node("b"), t0);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Online);
  severe.insert("b");
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Alerting);
  dir.upsert(node("b"), t0 + 5s);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Alerting);
  ASSERT_EQ(dir.live_peers().size(), 1u);
  ASSERT_TRUE(dir.live_peers()[0].status == model::NodeStatus::Alerting);

  // offline wins over alerting
  dir.sweep(t0 + 60s);
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Offline);
  ASSERT_TRUE(dir.live_peers().empty());
  dir.upsert(node("b"), t0 + 61s);
  ASSERT_TRUE(dir.peers()[0].status == model::NodeStatus::Alerting);

  severe.clear();
  ASSERT_TRUE(dir.find("b")->status == model::NodeStatus::Online);
}

TEST(directory_peer_discovered_after_its_alert_reads_alerting) {
  std::set<std::string, std::less<>> severe{"late"};
  app::NodeDirectory dir(node("self"), app::DirectoryOptions{},
                         [&](std::string_view id) { return severe.contains(id); });
  dir.upsert(node("late"), t0);
  ASSERT_TRUE(dir.find("late")->status == model::NodeStatus::Alerting);
}

TEST(directory_remove_forgets_peer) {
  app::NodeDirectory dir(node("self"));
  dir.upsert(node("b"), t0);
  ASSERT_TRUE(dir.remove("b"));
  ASSERT_TRUE(!dir.remove("b"));
  ASSERT_EQ(dir.size(), 0u);
}
