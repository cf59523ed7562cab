#include "app/RuleEngine.hpp"
#include "store/StateStore.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace skynode::app {

using model::AlertRule;
using model::Comparison;
using model::Severity;

RuleEngine::RuleEngine(store::StateStore* store) : store_(store) {}

void RuleEngine::set_source(std::string node_id, std::string node_name) {
  std::scoped_lock lk(mu_);
  node_id_ = std::move(node_id);
  node_name_ = std::move(node_name);
}

util::Result<void> RuleEngine::load() {
  std::vector<AlertRule> loaded;
  if (store_) {
    auto r = store_->load_rules();
    if (!r) return std::unexpected(r.error());
    loaded = std::move(*r);
  }
  bool fresh = loaded.empty();
  if (fresh) loaded = default_rules();
  std::scoped_lock lk(mu_);
  rules_.clear();
  for (auto& rule : loaded) {
    if (auto v = validate(rule); !v) {
      std::fprintf(stderr, "skynode: rules: dropping stored rule '%s': %s\n", rule.id.c_str(), v.error().message.c_str());
      continue;
    }
    rules_.push_back(std::move(rule));
  }
  if (fresh) {
    for (const auto& rule : rules_) persist(rule);
  }
  return {};
}

util::Result<void> RuleEngine::validate(const AlertRule& rule) {
  if (rule.id.empty()) return util::fail(util::Errc::InvalidRule, "rule id must not be empty");
  if (rule.metric_name.empty()) return util::fail(util::Errc::InvalidRule, "metric_name must not be empty");
  if (!std::isfinite(rule.threshold))
    return util::fail(util::Errc::InvalidRule, "threshold must be a finite number");
  if (!model::in_domain(rule.metric_name, rule.threshold)) {
    const auto* m = model::find_metric(rule.metric_name);
    char buf[160];
    std::snprintf(buf, sizeof(buf), "threshold %g is outside %s range [%g, %g]",
                  rule.threshold, rule.metric_name.c_str(), m ? m->domain.min : 0.0, m ? m->domain.max : 0.0);
    return util::fail(util::Errc::InvalidRule, buf);
  }
  return {};
}

util::Result<void> RuleEngine::add(AlertRule rule) {
  if (auto v = validate(rule); !v) return v;
  if (rule.name.empty()) rule.name = rule.id;
  rule.last_triggered.reset();
  std::scoped_lock lk(mu_);
  auto dup = std::any_of(rules_.begin(), rules_.end(), [&](const AlertRule& r){ return r.id == rule.id; });
  if (dup) return util::fail(util::Errc::DuplicateRule, "rule '" + rule.id + "' already exists");
  rules_.push_back(rule);
  persist(rules_.back());
  return {};
}

util::Result<void> RuleEngine::toggle(std::string_view id, bool enabled) {
  std::scoped_lock lk(mu_);
  auto it = std::find_if(rules_.begin(), rules_.end(), [&](const AlertRule& r){ return r.id == id; });
  if (it == rules_.end()) return util::fail(util::Errc::RuleNotFound, "no rule '" + std::string(id) + "'");
  // last_triggered survives a disable/enable cycle
  it->enabled = enabled;
  persist(*it);
  return {};
}

util::Result<void> RuleEngine::remove(std::string_view id) {
  std::scoped_lock lk(mu_);
  auto it = std::find_if(rules_.begin(), rules_.end(), [&](const AlertRule& r){ return r.id == id; });
  if (it == rules_.end()) return util::fail(util::Errc::RuleNotFound, "no rule '" + std::string(id) + "'");
  rules_.erase(it);
  if (store_) {
    if (auto r = store_->delete_rule(id); !r)
      std::fprintf(stderr, "skynode: rules: %s\n", r.error().message.c_str());
  }
  return {};
}

std::vector<AlertRule> RuleEngine::list() const {
  std::scoped_lock lk(mu_);
  return rules_;
}

std::optional<AlertRule> RuleEngine::find(std::string_view id) const {
  std::scoped_lock lk(mu_);
  for (const auto& r : rules_)
    if (r.id == id) return r;
  return std::nullopt;
}

util::Result<RuleState> RuleEngine::state_of(std::string_view id, util::TimePoint now) const {
  auto rule = find(id);
  if (!rule) return util::fail(util::Errc::RuleNotFound, "no rule '" + std::string(id) + "'");
  return in_cooldown(*rule, now) ? RuleState::Cooldown : RuleState::Idle;
}

// A clock that stepped backwards (now < last_triggered) re-arms the rule.
bool RuleEngine::in_cooldown(const AlertRule& rule, util::TimePoint now) {
  if (!rule.last_triggered) return false;
  auto elapsed = now - *rule.last_triggered;
  return elapsed >= util::Clock::duration::zero() && elapsed < std::chrono::seconds(rule.cooldown_seconds);
}

std::vector<model::AlertEvent> RuleEngine::evaluate(const model::MetricSample& sample) {
  std::vector<model::AlertEvent> events;
  std::scoped_lock lk(mu_);
  for (auto& rule : rules_) {
    if (!rule.enabled || rule.metric_name != sample.metric_name) continue;
    if (!model::compare(rule.comparison, sample.value, rule.threshold)) continue;
    if (in_cooldown(rule, sample.timestamp)) continue;
    rule.last_triggered = sample.timestamp;
    model::AlertEvent e;
    e.rule_id = rule.id;
    e.rule_name = rule.name;
    e.severity = rule.severity;
    e.message = format_message(rule, sample.value);
    e.source_node_id = node_id_;
    e.source_node_name = node_name_;
    e.timestamp = sample.timestamp;
    events.push_back(std::move(e));
    persist(rule);
  }
  return events;
}

std::string RuleEngine::format_message(const AlertRule& rule, double value) {
  const char* unit = model::unit_of(rule.metric_name);
  char buf[256];
  std::snprintf(buf, sizeof(buf), "%s: %s %.1f%s %s %.1f%s", rule.name.c_str(), rule.metric_name.c_str(),
                value, unit, model::to_symbol(rule.comparison), rule.threshold, unit);
  return std::string(buf);
}

void RuleEngine::persist(const AlertRule& rule) const {
  if (!store_) return;
  if (auto r = store_->save_rule(rule); !r)
    std::fprintf(stderr, "skynode: rules: cannot save '%s': %s\n", rule.id.c_str(), r.error().message.c_str());
}

std::vector<AlertRule> RuleEngine::default_rules() {
  auto make = [](const char* id, const char* name, const char* desc, std::string_view metric,
                 double threshold, Severity sev) {
    AlertRule r;
    r.id = id;
    r.name = name;
    r.description = desc;
    r.metric_name = std::string(metric);
    r.threshold = threshold;
    r.comparison = Comparison::Greater;
    r.severity = sev;
    return r;
  };
  namespace m = model::metric;
  return {
    make("cpu_high", "CPU High", "CPU usage above 80%", m::kCpuUsage, 80.0, Severity::Warning),
    make("cpu_critical", "CPU Critical", "CPU usage above 95%", m::kCpuUsage, 95.0, Severity::Critical),
    make("memory_high", "Memory High", "Memory usage above 85%", m::kMemoryUsagePercent, 85.0, Severity::Warning),
    make("disk_high", "Disk High", "Disk usage above 90%", m::kDiskUsagePercent, 90.0, Severity::Warning),
    make("cpu_temp_high", "CPU Temperature High", "CPU temperature above 85C", m::kCpuTemperature, 85.0, Severity::Warning),
    make("chipset_warning", "Chipset Temperature Warning", "Chipset temperature above 60C", m::kChipsetTemperature, 60.0, Severity::Warning),
    make("chipset_critical", "Chipset Temperature Critical", "Chipset temperature above 70C", m::kChipsetTemperature, 70.0, Severity::Critical),
    make("nvme_temp_high", "NVMe Temperature High", "NVMe temperature above 70C", m::kDiskMaxTemperature, 70.0, Severity::Warning),
    make("nvme_temp_critical", "NVMe Temperature Critical", "NVMe temperature above 80C", m::kDiskMaxTemperature, 80.0, Severity::Critical),
    make("fan_stopped", "Fan Stopped", "A fan reports 0 RPM", m::kFansStopped, 0.0, Severity::Critical),
    make("fan_slow_speed", "Fan Slow", "A fan spins below the slow-speed threshold", m::kFansSlow, 0.0, Severity::Warning),
  };
}

} // namespace skynode::app
