#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/Clock.hpp"

namespace skynode::model {

enum class Severity { Info, Warning, Error, Critical };

enum class Comparison { Greater, GreaterEqual, Less, LessEqual };

[[nodiscard]] constexpr const char* to_string(Severity s) {
  switch (s) {
    case Severity::Info:     return "info";
    case Severity::Warning:  return "warning";
    case Severity::Error:    return "error";
    case Severity::Critical: return "critical";
  }
  return "info";
}

[[nodiscard]] inline std::optional<Severity> parse_severity(std::string_view s) {
  std::string l(s);
  for (auto& c : l) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  if (l == "info") return Severity::Info;
  if (l == "warning" || l == "warn") return Severity::Warning;
  if (l == "error") return Severity::Error;
  if (l == "critical" || l == "crit") return Severity::Critical;
  return std::nullopt;
}

// Error and Critical alerts put their source node into the Alerting state.
[[nodiscard]] constexpr bool is_severe(Severity s) {
  return s == Severity::Error || s == Severity::Critical;
}

[[nodiscard]] constexpr const char* to_symbol(Comparison c) {
  switch (c) {
    case Comparison::Greater:      return ">";
    case Comparison::GreaterEqual: return ">=";
    case Comparison::Less:         return "<";
    case Comparison::LessEqual:    return "<=";
  }
  return ">";
}

[[nodiscard]] inline std::optional<Comparison> parse_comparison(std::string_view s) {
  if (s == ">" || s == "gt") return Comparison::Greater;
  if (s == ">=" || s == "ge") return Comparison::GreaterEqual;
  if (s == "<" || s == "lt") return Comparison::Less;
  if (s == "<=" || s == "le") return Comparison::LessEqual;
  return std::nullopt;
}

[[nodiscard]] constexpr bool compare(Comparison c, double value, double threshold) {
  switch (c) {
    case Comparison::Greater:      return value > threshold;
    case Comparison::GreaterEqual: return value >= threshold;
    case Comparison::Less:         return value < threshold;
    case Comparison::LessEqual:    return value <= threshold;
  }
  return false;
}

struct AlertRule {
  std::string id;
  std::string name;
  std::string description;
  std::string metric_name;
  double threshold{};
  Comparison comparison{Comparison::Greater};
  Severity severity{Severity::Warning};
  uint32_t cooldown_seconds{300};
  bool enabled{true};
  std::optional<util::TimePoint> last_triggered; // written by RuleEngine only
  std::vector<std::string> notify_nodes;         // empty: every live peer
};

struct AlertEvent {
  std::string rule_id;
  std::string rule_name;
  Severity severity{Severity::Info};
  std::string message;
  std::string source_node_id;
  std::string source_node_name;
  util::TimePoint timestamp{};
};

struct AlertRecord {
  std::string id;
  AlertEvent event;
  bool acknowledged{false};
};

} // namespace skynode::model
