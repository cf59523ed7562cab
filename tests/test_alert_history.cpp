#include "minitest.hpp"
#include "app/AlertHistory.hpp"
#include "model/Json.hpp"

#include <set>
#include <string>

using namespace skynode;

static model::AlertEvent event(const char* rule, model::Severity sev, const char* node = "node-a") {
  model::AlertEvent e;
  e.rule_id = rule;
  e.rule_name = rule;
  e.severity = sev;
  e.message = std::string(rule) + " fired";
  e.source_node_id = node;
  e.source_node_name = node;
  e.timestamp = util::from_epoch_ms(1'700'000'000'000LL);
  return e;
}

TEST(history_records_get_unique_ids) {
  app::AlertHistory h;
  std::set<std::string> ids;
  for (int i = 0; i < 20; ++i) ids.insert(h.record(event("cpu_high", model::Severity::Warning)).id);
  ASSERT_EQ(ids.size(), 20u);
  ASSERT_EQ(h.size(), 20u);
  auto all = h.list();
  ASSERT_TRUE(!all.front().acknowledged);
}

TEST(history_acknowledge_is_idempotent) {
  app::AlertHistory h;
  auto rec = h.record(event("cpu_high", model::Severity::Warning));
  ASSERT_EQ(h.unacknowledged().size(), 1u);
  ASSERT_TRUE(h.acknowledge(rec.id));
  ASSERT_TRUE(h.acknowledge(rec.id));
  ASSERT_TRUE(h.unacknowledged().empty());
  ASSERT_TRUE(h.find(rec.id)->acknowledged);
}

TEST(history_acknowledge_unknown_id_fails) {
  app::AlertHistory h;
  auto r = h.acknowledge("no-such-record");
  ASSERT_TRUE(!r);
  ASSERT_TRUE(r.error().code == util::Errc::RecordNotFound);
}

TEST(history_evicts_oldest_beyond_capacity) {
  app::AlertHistory h(3);
  auto first = h.record(event("r1", model::Severity::Info));
  h.record(event("r2", model::Severity::Info));
  h.record(event("r3", model::Severity::Info));
  h.record(event("r4", model::Severity::Info));
  ASSERT_EQ(h.size(), 3u);
  ASSERT_TRUE(!h.find(first.id).has_value());
  auto all = h.list();
  ASSERT_EQ(all.front().event.rule_id, std::string("r2"));
  ASSERT_EQ(all.back().event.rule_id, std::string("r4"));
}

TEST(history_severe_tracking_per_node) {
  app::AlertHistory h;
  h.record(event("cpu_high", model::Severity::Warning, "node-b"));
  ASSERT_TRUE(!h.has_unacknowledged_severe("node-b"));
  auto crit = h.record(event("cpu_critical", model::Severity::Critical, "node-b"));
  ASSERT_TRUE(h.has_unacknowledged_severe("node-b"));
  ASSERT_TRUE(!h.has_unacknowledged_severe("node-c"));
  ASSERT_TRUE(h.acknowledge(crit.id));
  ASSERT_TRUE(!h.has_unacknowledged_severe("node-b"));
}

TEST(history_clear_empties_log) {
  app::AlertHistory h;
  h.record(event("cpu_high", model::Severity::Warning));
  h.clear();
  ASSERT_EQ(h.size(), 0u);
  ASSERT_TRUE(h.list().empty());
}

TEST(history_export_is_json_array) {
  app::AlertHistory h;
  h.record(event("cpu_high", model::Severity::Warning));
  h.record(event("disk_high", model::Severity::Error));
  auto parsed = model::parse_json(h.export_json());
  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->isArray());
  ASSERT_EQ(parsed->size(), 2u);
  ASSERT_EQ((*parsed)[0]["rule_id"].asString(), std::string("cpu_high"));
  ASSERT_EQ((*parsed)[1]["severity"].asString(), std::string("error"));
  ASSERT_TRUE(!(*parsed)[1]["acknowledged"].asBool());
}
