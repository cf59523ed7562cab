#include "minitest.hpp"
#include "app/AlertHistory.hpp"
#include "app/RuleEngine.hpp"
#include "store/StateStore.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace skynode;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path fresh_db(const char* tag) {
  fs::path dir = fs::temp_directory_path() / ("skynode_test_state_" + std::string(tag)) / std::to_string(::getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir / "skynode.db";
}

static const util::TimePoint t0 = util::from_epoch_ms(1'700'000'000'000LL);

static model::AlertRule rule(const char* id, double threshold) {
  model::AlertRule r;
  r.id = id;
  r.name = id;
  r.metric_name = "cpu_usage";
  r.threshold = threshold;
  return r;
}

static model::AlertRecord record(const char* id, const char* rule_id) {
  model::AlertRecord r;
  r.id = id;
  r.event.rule_id = rule_id;
  r.event.rule_name = rule_id;
  r.event.severity = model::Severity::Error;
  r.event.message = "m";
  r.event.source_node_id = "node-a";
  r.event.source_node_name = "alpha";
  r.event.timestamp = t0;
  return r;
}

TEST(state_rules_round_trip) {
  auto st = store::StateStore::open(fresh_db("rules"));
  ASSERT_TRUE(st.has_value());
  auto& s = **st;

  auto a = rule("a", 50.0);
  a.notify_nodes = {"node-b", "node-c"};
  a.last_triggered = t0;
  a.comparison = model::Comparison::LessEqual;
  a.severity = model::Severity::Critical;
  ASSERT_TRUE(s.save_rule(a));
  ASSERT_TRUE(s.save_rule(rule("b", 60.0)));

  // an update keeps the original position
  a.threshold = 55.0;
  a.enabled = false;
  ASSERT_TRUE(s.save_rule(a));

  auto loaded = s.load_rules();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  const auto& la = (*loaded)[0];
  ASSERT_EQ(la.id, std::string("a"));
  ASSERT_EQ(la.threshold, 55.0);
  ASSERT_TRUE(!la.enabled);
  ASSERT_TRUE(la.comparison == model::Comparison::LessEqual);
  ASSERT_TRUE(la.severity == model::Severity::Critical);
  ASSERT_TRUE(la.last_triggered.has_value() && *la.last_triggered == t0);
  ASSERT_EQ(la.notify_nodes.size(), 2u);
  ASSERT_EQ(la.notify_nodes[1], std::string("node-c"));
  ASSERT_TRUE(!(*loaded)[1].last_triggered.has_value());

  ASSERT_TRUE(s.delete_rule("a"));
  ASSERT_EQ(s.load_rules()->size(), 1u);
}

TEST(state_records_keep_insertion_order) {
  auto st = store::StateStore::open(fresh_db("records"));
  ASSERT_TRUE(st.has_value());
  auto& s = **st;
  ASSERT_TRUE(s.save_record(record("r1", "x")));
  ASSERT_TRUE(s.save_record(record("r2", "y")));
  auto r1 = record("r1", "x");
  r1.acknowledged = true;
  ASSERT_TRUE(s.save_record(r1));

  auto loaded = s.load_records();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  ASSERT_EQ((*loaded)[0].id, std::string("r1"));
  ASSERT_TRUE((*loaded)[0].acknowledged);
  ASSERT_TRUE((*loaded)[0].event.timestamp == t0);
  ASSERT_EQ((*loaded)[1].event.source_node_name, std::string("alpha"));

  ASSERT_TRUE(s.delete_record("r2"));
  ASSERT_EQ(s.load_records()->size(), 1u);
  ASSERT_TRUE(s.clear_records());
  ASSERT_TRUE(s.load_records()->empty());
}

TEST(state_engine_and_history_survive_reopen) {
  auto path = fresh_db("reload");
  std::string rec_id;
  {
    auto st = store::StateStore::open(path);
    ASSERT_TRUE(st.has_value());
    app::RuleEngine eng(st->get());
    ASSERT_TRUE(eng.load());
    ASSERT_EQ(eng.list().size(), 11u);
    ASSERT_TRUE(eng.add(rule("custom", 42.0)));
    ASSERT_TRUE(eng.remove("disk_high"));
    ASSERT_EQ(eng.evaluate(model::MetricSample{"cpu_usage", 85.0, t0}).size(), 2u);

    app::AlertHistory hist(10, st->get());
    ASSERT_TRUE(hist.load());
    rec_id = hist.record(record("ignored", "cpu_high").event).id;
    hist.record(record("ignored", "custom").event);
    ASSERT_TRUE(hist.acknowledge(rec_id));
  }
  auto st = store::StateStore::open(path);
  ASSERT_TRUE(st.has_value());
  app::RuleEngine eng(st->get());
  ASSERT_TRUE(eng.load());
  ASSERT_EQ(eng.list().size(), 11u);
  ASSERT_TRUE(!eng.find("disk_high").has_value());
  ASSERT_TRUE(eng.find("custom").has_value());
  auto cpu_high = eng.find("cpu_high");
  ASSERT_TRUE(cpu_high->last_triggered.has_value() && *cpu_high->last_triggered == t0);
  // still cooling down after the restart
  ASSERT_TRUE(eng.evaluate(model::MetricSample{"cpu_usage", 85.0, t0 + 10s}).size() == 0u);

  app::AlertHistory hist(10, st->get());
  ASSERT_TRUE(hist.load());
  ASSERT_EQ(hist.size(), 2u);
  ASSERT_TRUE(hist.find(rec_id)->acknowledged);
  ASSERT_EQ(hist.list()[1].event.rule_id, std::string("custom"));
}

TEST(state_history_load_trims_to_capacity) {
  auto path = fresh_db("trim");
  auto st = store::StateStore::open(path);
  ASSERT_TRUE(st.has_value());
  for (int i = 0; i < 5; ++i) {
    std::string id = "r" + std::to_string(i);
    ASSERT_TRUE((*st)->save_record(record(id.c_str(), "x")));
  }
  app::AlertHistory hist(3, st->get());
  ASSERT_TRUE(hist.load());
  ASSERT_EQ(hist.size(), 3u);
  ASSERT_EQ(hist.list().front().id, std::string("r2"));
  ASSERT_EQ((*st)->load_records()->size(), 3u);
}

static std::vector<std::string> ids_of(const auto& items) {
  std::vector<std::string> out;
  for (const auto& i : items) out.push_back(i.id);
  return out;
}

TEST(state_rule_writes_stay_in_step_with_concurrent_evaluation) {
  auto st = store::StateStore::open(fresh_db("rule_race"));
  ASSERT_TRUE(st.has_value());
  app::RuleEngine eng(st->get());
  auto doomed = rule("doomed", 10.0);
  doomed.cooldown_seconds = 0;
  auto muted = rule("muted", 10.0);
  muted.cooldown_seconds = 0;
  ASSERT_TRUE(eng.add(doomed));
  ASSERT_TRUE(eng.add(muted));

  std::jthread sampler([&] {
    for (int i = 0; i < 400; ++i)
      (void)eng.evaluate(model::MetricSample{"cpu_usage", 90.0, t0 + std::chrono::seconds(i)});
  });
  std::this_thread::sleep_for(5ms);
  ASSERT_TRUE(eng.remove("doomed"));
  ASSERT_TRUE(eng.toggle("muted", false));
  sampler.join();

  auto stored = (*st)->load_rules();
  ASSERT_TRUE(stored.has_value());
  ASSERT_TRUE(ids_of(*stored) == ids_of(eng.list()));
  ASSERT_EQ(stored->size(), 1u);
  ASSERT_TRUE(!(*stored)[0].enabled);
  ASSERT_TRUE((*stored)[0].last_triggered == eng.find("muted")->last_triggered);
}

TEST(state_history_writes_stay_in_step_with_concurrent_clear) {
  auto st = store::StateStore::open(fresh_db("history_race"));
  ASSERT_TRUE(st.has_value());
  app::AlertHistory hist(50, st->get());

  std::jthread writer([&] {
    for (int i = 0; i < 300; ++i) hist.record(record("ignored", "cpu_high").event);
  });
  std::this_thread::sleep_for(5ms);
  hist.clear();
  // the record may already be evicted; acknowledge only needs to race the writer
  if (auto snap = hist.list(); !snap.empty()) (void)hist.acknowledge(snap.back().id);
  writer.join();

  auto stored = (*st)->load_records();
  ASSERT_TRUE(stored.has_value());
  auto mem = hist.list();
  ASSERT_TRUE(ids_of(*stored) == ids_of(mem));
  for (size_t i = 0; i < mem.size(); ++i) ASSERT_EQ((*stored)[i].acknowledged, mem[i].acknowledged);
}
