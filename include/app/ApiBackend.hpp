#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "model/Alert.hpp"
#include "model/Metric.hpp"
#include "model/Node.hpp"
#include "util/Error.hpp"

namespace skynode::app {

// Query and command surface shared by the HTTP API and the UI shell.
class ApiBackend {
public:
  virtual ~ApiBackend() = default;

  [[nodiscard]] virtual model::Node self_node() const = 0;
  [[nodiscard]] virtual std::vector<model::MetricSample> hardware_snapshot() const = 0;
  [[nodiscard]] virtual std::vector<model::MetricSample> metric_history(std::string_view metric, size_t max_points) const = 0;

  [[nodiscard]] virtual std::vector<model::Node> peers() const = 0;
  virtual bool forget_peer(std::string_view id) = 0;

  [[nodiscard]] virtual std::vector<model::AlertRule> rules() const = 0;
  [[nodiscard]] virtual util::Result<void> add_rule(model::AlertRule rule) = 0;
  [[nodiscard]] virtual util::Result<void> toggle_rule(std::string_view id, bool enabled) = 0;
  [[nodiscard]] virtual util::Result<void> remove_rule(std::string_view id) = 0;

  [[nodiscard]] virtual std::vector<model::AlertRecord> history(bool unacknowledged_only) const = 0;
  [[nodiscard]] virtual util::Result<void> acknowledge(std::string_view record_id) = 0;
  virtual void clear_history() = 0;
  [[nodiscard]] virtual std::string export_history() const = 0;

  // A peer's alert. Recorded only; never evaluated against local rules.
  [[nodiscard]] virtual util::Result<void> receive_notification(model::AlertEvent event) = 0;
};

} // namespace skynode::app
