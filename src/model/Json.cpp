#include "model/Json.hpp"

#include <exception>
#include <memory>

namespace skynode::model {

util::Result<Json::Value> parse_json(std::string_view text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  // jsoncpp throws on nesting past its stack limit.
  try {
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs))
      return util::fail(util::Errc::BadRequest, "invalid JSON: " + errs);
  } catch (const std::exception& e) {
    return util::fail(util::Errc::BadRequest, std::string("invalid JSON: ") + e.what());
  }
  return root;
}

std::string write_compact(const Json::Value& v) {
  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";
  return Json::writeString(wb, v);
}

std::string write_pretty(const Json::Value& v) {
  Json::StreamWriterBuilder wb;
  wb["indentation"] = "  ";
  return Json::writeString(wb, v);
}

static Json::Value ms_value(util::TimePoint tp) {
  return Json::Value(static_cast<Json::Int64>(util::to_epoch_ms(tp)));
}

Json::Value to_json(const MetricSample& s) {
  Json::Value v(Json::objectValue);
  v["metric_name"] = s.metric_name;
  v["value"] = s.value;
  v["timestamp"] = ms_value(s.timestamp);
  return v;
}

Json::Value to_json(const AlertRule& r) {
  Json::Value v(Json::objectValue);
  v["id"] = r.id;
  v["name"] = r.name;
  v["description"] = r.description;
  v["metric_name"] = r.metric_name;
  v["threshold"] = r.threshold;
  v["comparison"] = to_symbol(r.comparison);
  v["severity"] = to_string(r.severity);
  v["cooldown_seconds"] = Json::Value(static_cast<Json::UInt>(r.cooldown_seconds));
  v["enabled"] = r.enabled;
  v["last_triggered"] = r.last_triggered ? ms_value(*r.last_triggered) : Json::Value(Json::nullValue);
  Json::Value targets(Json::arrayValue);
  for (const auto& id : r.notify_nodes) targets.append(id);
  v["notify_nodes"] = targets;
  return v;
}

Json::Value to_json(const AlertRecord& r) {
  Json::Value v = notification_to_json(r.event);
  v["id"] = r.id;
  v["acknowledged"] = r.acknowledged;
  return v;
}

Json::Value to_json(const Node& n) {
  Json::Value v(Json::objectValue);
  v["id"] = n.id;
  v["name"] = n.name;
  v["ip_address"] = n.ip_address;
  v["api_port"] = Json::Value(static_cast<Json::UInt>(n.api_port));
  v["api_url"] = n.api_url();
  v["os_info"] = n.os_info;
  v["version"] = n.version;
  v["status"] = to_string(n.status);
  v["last_seen"] = ms_value(n.last_seen);
  return v;
}

Json::Value notification_to_json(const AlertEvent& e) {
  Json::Value v(Json::objectValue);
  v["source_node_id"] = e.source_node_id;
  v["source_node_name"] = e.source_node_name;
  v["rule_id"] = e.rule_id;
  v["rule_name"] = e.rule_name;
  v["severity"] = to_string(e.severity);
  v["message"] = e.message;
  v["timestamp"] = ms_value(e.timestamp);
  return v;
}

util::Result<AlertEvent> notification_from_json(const Json::Value& v) {
  auto bad = [](const char* what) {
    return util::fail(util::Errc::MalformedNotification, what);
  };
  if (!v.isObject()) return bad("notification must be a JSON object");

  AlertEvent e;
  const auto& src = v["source_node_id"];
  if (!src.isString() || src.asString().empty()) return bad("source_node_id must be a non-empty string");
  e.source_node_id = src.asString();

  // "alert_type" is accepted as an older name for the rule id
  const auto& rid = v.isMember("rule_id") ? v["rule_id"] : v["alert_type"];
  if (!rid.isString() || rid.asString().empty()) return bad("rule_id must be a non-empty string");
  e.rule_id = rid.asString();

  const auto& sev = v["severity"];
  if (!sev.isString()) return bad("severity must be a string");
  auto parsed = parse_severity(sev.asString());
  if (!parsed) return bad("severity must be one of info, warning, error, critical");
  e.severity = *parsed;

  const auto& msg = v["message"];
  if (!msg.isString()) return bad("message must be a string");
  e.message = msg.asString();

  const auto& ts = v["timestamp"];
  if (!ts.isIntegral() || !ts.isInt64() || ts.asInt64() < 0 || ts.asInt64() > util::kMaxEpochMs)
    return bad("timestamp must be non-negative epoch milliseconds");
  e.timestamp = util::from_epoch_ms(ts.asInt64());

  const auto& name = v["source_node_name"];
  if (!name.isNull() && !name.isString()) return bad("source_node_name must be a string");
  e.source_node_name = name.isString() && !name.asString().empty() ? name.asString() : e.source_node_id;

  const auto& rname = v["rule_name"];
  if (!rname.isNull() && !rname.isString()) return bad("rule_name must be a string");
  e.rule_name = rname.isString() && !rname.asString().empty() ? rname.asString() : e.rule_id;
  return e;
}

util::Result<AlertRule> rule_from_json(const Json::Value& v) {
  auto bad = [](const char* what) {
    return util::fail(util::Errc::InvalidRule, what);
  };
  if (!v.isObject()) return bad("rule must be a JSON object");

  AlertRule r;
  if (!v["id"].isString()) return bad("id must be a string");
  r.id = v["id"].asString();
  if (!v["metric_name"].isString()) return bad("metric_name must be a string");
  r.metric_name = v["metric_name"].asString();
  if (!v["threshold"].isNumeric()) return bad("threshold must be a number");
  r.threshold = v["threshold"].asDouble();

  if (!v["comparison"].isString()) return bad("comparison must be a string");
  auto cmp = parse_comparison(v["comparison"].asString());
  if (!cmp) return bad("comparison must be one of >, >=, <, <=");
  r.comparison = *cmp;

  if (!v["severity"].isString()) return bad("severity must be a string");
  auto sev = parse_severity(v["severity"].asString());
  if (!sev) return bad("severity must be one of info, warning, error, critical");
  r.severity = *sev;

  if (v.isMember("name")) {
    if (!v["name"].isString()) return bad("name must be a string");
    r.name = v["name"].asString();
  }
  if (r.name.empty()) r.name = r.id;
  if (v.isMember("description")) {
    if (!v["description"].isString()) return bad("description must be a string");
    r.description = v["description"].asString();
  }
  if (v.isMember("cooldown_seconds")) {
    const auto& cd = v["cooldown_seconds"];
    if (!cd.isIntegral() || !cd.isInt64() || cd.asInt64() < 0 || cd.asInt64() > 0xFFFFFFFFLL)
      return bad("cooldown_seconds must be a non-negative integer");
    r.cooldown_seconds = static_cast<uint32_t>(cd.asInt64());
  }
  if (v.isMember("enabled")) {
    if (!v["enabled"].isBool()) return bad("enabled must be a boolean");
    r.enabled = v["enabled"].asBool();
  }
  if (v.isMember("notify_nodes")) {
    const auto& nn = v["notify_nodes"];
    if (!nn.isArray()) return bad("notify_nodes must be an array of node ids");
    for (const auto& id : nn) {
      if (!id.isString()) return bad("notify_nodes must be an array of node ids");
      r.notify_nodes.push_back(id.asString());
    }
  }
  return r;
}

Json::Value records_to_json(const std::vector<AlertRecord>& records) {
  Json::Value arr(Json::arrayValue);
  for (const auto& r : records) arr.append(to_json(r));
  return arr;
}

} // namespace skynode::model
