#include "minitest.hpp"
#include "app/RuleEngine.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <string>

using namespace skynode;
using namespace std::chrono_literals;

static const util::TimePoint t0 = util::from_epoch_ms(1'700'000'000'000LL);

static model::AlertRule cpu_rule(const char* id = "cpu_high", double threshold = 80.0) {
  model::AlertRule r;
  r.id = id;
  r.name = "CPU High";
  r.metric_name = "cpu_usage";
  r.threshold = threshold;
  r.comparison = model::Comparison::Greater;
  r.severity = model::Severity::Warning;
  r.cooldown_seconds = 300;
  return r;
}

static model::MetricSample cpu(double v, util::TimePoint ts) { return {"cpu_usage", v, ts}; }

TEST(rule_fires_once_then_cools_down) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  eng.set_source("node-a", "alpha");

  auto e1 = eng.evaluate(cpu(85.0, t0));
  ASSERT_EQ(e1.size(), 1u);
  ASSERT_EQ(e1[0].rule_id, std::string("cpu_high"));
  ASSERT_EQ(e1[0].source_node_id, std::string("node-a"));
  ASSERT_EQ(e1[0].source_node_name, std::string("alpha"));
  ASSERT_TRUE(e1[0].timestamp == t0);
  ASSERT_EQ(e1[0].message, std::string("CPU High: cpu_usage 85.0% > 80.0%"));

  ASSERT_TRUE(eng.evaluate(cpu(90.0, t0 + 10s)).empty());
  auto st = eng.state_of("cpu_high", t0 + 10s);
  ASSERT_TRUE(st.has_value());
  ASSERT_TRUE(*st == app::RuleState::Cooldown);

  ASSERT_EQ(eng.evaluate(cpu(90.0, t0 + 301s)).size(), 1u);
  auto rule = eng.find("cpu_high");
  ASSERT_TRUE(rule.has_value());
  ASSERT_TRUE(rule->last_triggered.has_value());
  ASSERT_TRUE(*rule->last_triggered == t0 + 301s);
}

TEST(rule_below_threshold_and_other_metric_do_not_fire) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  ASSERT_TRUE(eng.evaluate(cpu(80.0, t0)).empty());
  ASSERT_TRUE(eng.evaluate(model::MetricSample{"memory_usage_percent", 99.0, t0}).empty());
  auto st = eng.state_of("cpu_high", t0);
  ASSERT_TRUE(*st == app::RuleState::Idle);
}

TEST(rule_disabled_is_skipped_and_keeps_last_triggered) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  ASSERT_EQ(eng.evaluate(cpu(85.0, t0)).size(), 1u);
  ASSERT_TRUE(eng.toggle("cpu_high", false));
  ASSERT_TRUE(eng.evaluate(cpu(99.0, t0 + 400s)).empty());
  ASSERT_TRUE(eng.toggle("cpu_high", true));
  auto rule = eng.find("cpu_high");
  ASSERT_TRUE(rule->last_triggered.has_value());
  ASSERT_TRUE(*rule->last_triggered == t0);
  ASSERT_EQ(eng.evaluate(cpu(99.0, t0 + 400s)).size(), 1u);
}

TEST(rule_unknown_ids_report_not_found) {
  app::RuleEngine eng;
  auto t = eng.toggle("missing", true);
  ASSERT_TRUE(!t);
  ASSERT_TRUE(t.error().code == util::Errc::RuleNotFound);
  auto r = eng.remove("missing");
  ASSERT_TRUE(!r);
  ASSERT_TRUE(r.error().code == util::Errc::RuleNotFound);
  auto s = eng.state_of("missing", t0);
  ASSERT_TRUE(!s);
  ASSERT_TRUE(s.error().code == util::Errc::RuleNotFound);
}

TEST(rule_validation_rejects_bad_rules) {
  auto empty_id = cpu_rule("");
  ASSERT_TRUE(app::RuleEngine::validate(empty_id).error().code == util::Errc::InvalidRule);
  auto no_metric = cpu_rule();
  no_metric.metric_name.clear();
  ASSERT_TRUE(!app::RuleEngine::validate(no_metric));
  ASSERT_TRUE(!app::RuleEngine::validate(cpu_rule("x", 150.0)));
  ASSERT_TRUE(!app::RuleEngine::validate(cpu_rule("x", -1.0)));
  ASSERT_TRUE(!app::RuleEngine::validate(cpu_rule("x", std::numeric_limits<double>::quiet_NaN())));
  ASSERT_TRUE(app::RuleEngine::validate(cpu_rule("x", 100.0)));

  auto custom = cpu_rule("custom");
  custom.metric_name = "my_custom_metric";
  custom.threshold = 12345.0;
  ASSERT_TRUE(app::RuleEngine::validate(custom));
}

TEST(rule_duplicate_id_is_rejected) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  auto r = eng.add(cpu_rule("cpu_high", 50.0));
  ASSERT_TRUE(!r);
  ASSERT_TRUE(r.error().code == util::Errc::DuplicateRule);
  ASSERT_EQ(eng.list().size(), 1u);
  ASSERT_EQ(eng.find("cpu_high")->threshold, 80.0);
}

TEST(rule_add_ignores_supplied_last_triggered) {
  app::RuleEngine eng;
  auto r = cpu_rule();
  r.last_triggered = t0;
  ASSERT_TRUE(eng.add(r));
  ASSERT_TRUE(!eng.find("cpu_high")->last_triggered.has_value());
  ASSERT_EQ(eng.evaluate(cpu(85.0, t0 + 1s)).size(), 1u);
}

TEST(rule_remove_stops_evaluation) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  ASSERT_TRUE(eng.remove("cpu_high"));
  ASSERT_TRUE(eng.list().empty());
  ASSERT_TRUE(eng.evaluate(cpu(99.0, t0)).empty());
}

TEST(rule_several_rules_fire_on_one_sample) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.load());
  auto events = eng.evaluate(cpu(99.0, t0));
  ASSERT_EQ(events.size(), 2u);
  ASSERT_EQ(events[0].rule_id, std::string("cpu_high"));
  ASSERT_EQ(events[1].rule_id, std::string("cpu_critical"));
  ASSERT_TRUE(events[1].severity == model::Severity::Critical);
}

TEST(rule_backward_clock_rearms) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.add(cpu_rule()));
  ASSERT_EQ(eng.evaluate(cpu(85.0, t0)).size(), 1u);
  ASSERT_EQ(eng.evaluate(cpu(85.0, t0 - 60s)).size(), 1u);
}

TEST(rule_defaults_cover_builtin_metrics) {
  auto defs = app::RuleEngine::default_rules();
  ASSERT_EQ(defs.size(), 11u);
  for (const auto& r : defs) {
    ASSERT_TRUE(app::RuleEngine::validate(r));
    ASSERT_TRUE(model::find_metric(r.metric_name) != nullptr);
    ASSERT_TRUE(r.enabled);
    ASSERT_EQ(r.cooldown_seconds, 300u);
  }
  auto has = [&](const char* id){
    return std::any_of(defs.begin(), defs.end(), [&](const auto& r){ return r.id == id; });
  };
  ASSERT_TRUE(has("cpu_high"));
  ASSERT_TRUE(has("memory_high"));
  ASSERT_TRUE(has("fan_stopped"));
  ASSERT_TRUE(has("chipset_critical"));
}

TEST(rule_fan_stopped_fires_on_one_stopped_fan) {
  app::RuleEngine eng;
  ASSERT_TRUE(eng.load());
  auto events = eng.evaluate(model::MetricSample{"fans_stopped_count", 1.0, t0});
  ASSERT_EQ(events.size(), 1u);
  ASSERT_EQ(events[0].rule_id, std::string("fan_stopped"));
  ASSERT_TRUE(eng.evaluate(model::MetricSample{"fans_stopped_count", 0.0, t0 + 400s}).empty());
}

TEST(rule_message_uses_metric_unit) {
  auto r = cpu_rule();
  r.name = "CPU Temperature High";
  r.metric_name = "cpu_temperature";
  r.threshold = 85.0;
  ASSERT_EQ(app::RuleEngine::format_message(r, 91.25),
            std::string("CPU Temperature High: cpu_temperature 91.2C > 85.0C"));
}
