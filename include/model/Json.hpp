#pragma once

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

#include "model/Alert.hpp"
#include "model/Metric.hpp"
#include "model/Node.hpp"
#include "util/Error.hpp"

namespace skynode::model {

[[nodiscard]] util::Result<Json::Value> parse_json(std::string_view text);
[[nodiscard]] std::string write_compact(const Json::Value& v);
[[nodiscard]] std::string write_pretty(const Json::Value& v);

[[nodiscard]] Json::Value to_json(const MetricSample& s);
[[nodiscard]] Json::Value to_json(const AlertRule& r);
[[nodiscard]] Json::Value to_json(const AlertRecord& r);
[[nodiscard]] Json::Value to_json(const Node& n);

// Wire form of a notification sent to peers' /alerts/notify.
[[nodiscard]] Json::Value notification_to_json(const AlertEvent& e);

// Fails with MalformedNotification naming the first offending field.
[[nodiscard]] util::Result<AlertEvent> notification_from_json(const Json::Value& v);

// Rule as submitted by the UI shell. last_triggered is never taken from input.
// Fails with InvalidRule naming the first offending field.
[[nodiscard]] util::Result<AlertRule> rule_from_json(const Json::Value& v);

[[nodiscard]] Json::Value records_to_json(const std::vector<AlertRecord>& records);

} // namespace skynode::model
