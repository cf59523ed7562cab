#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/Alert.hpp"
#include "model/Metric.hpp"
#include "util/Error.hpp"

namespace skynode::store { class StateStore; }

namespace skynode::app {

enum class RuleState { Idle, Cooldown };

[[nodiscard]] constexpr const char* to_string(RuleState s) {
  return s == RuleState::Cooldown ? "cooldown" : "idle";
}

// Threshold rules evaluated against every incoming sample. A rule that
// matches fires once and then stays quiet for cooldown_seconds, measured on
// sample timestamps.
class RuleEngine {
public:
  // store may be null (in-memory only).
  explicit RuleEngine(store::StateStore* store = nullptr);
  RuleEngine(const RuleEngine&) = delete;
  RuleEngine& operator=(const RuleEngine&) = delete;

  // Loads persisted rules; installs default_rules() when none are stored.
  [[nodiscard]] util::Result<void> load();

  // Identity stamped onto emitted events.
  void set_source(std::string node_id, std::string node_name);

  [[nodiscard]] util::Result<void> add(model::AlertRule rule);
  [[nodiscard]] util::Result<void> toggle(std::string_view id, bool enabled);
  [[nodiscard]] util::Result<void> remove(std::string_view id);

  [[nodiscard]] std::vector<model::AlertRule> list() const;
  [[nodiscard]] std::optional<model::AlertRule> find(std::string_view id) const;
  [[nodiscard]] util::Result<RuleState> state_of(std::string_view id, util::TimePoint now) const;

  // Zero or more events, one per rule that fired on this sample.
  std::vector<model::AlertEvent> evaluate(const model::MetricSample& sample);

  [[nodiscard]] static util::Result<void> validate(const model::AlertRule& rule);
  [[nodiscard]] static std::vector<model::AlertRule> default_rules();
  [[nodiscard]] static std::string format_message(const model::AlertRule& rule, double value);

private:
  [[nodiscard]] static bool in_cooldown(const model::AlertRule& rule, util::TimePoint now);
  // Caller holds mu_, so the stored row never lags behind a later mutation.
  void persist(const model::AlertRule& rule) const;

  store::StateStore* store_;
  mutable std::mutex mu_;
  std::vector<model::AlertRule> rules_;
  std::string node_id_;
  std::string node_name_;
};

} // namespace skynode::app
