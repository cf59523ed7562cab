#include "app/ApiRouter.hpp"
#include "app/PrometheusSerializer.hpp"
#include "app/Version.hpp"
#include "model/Json.hpp"

#include <charconv>
#include <vector>

namespace skynode::app {

using net::HttpRequest;
using net::HttpResponse;

int status_for(util::Errc code) {
  switch (code) {
    case util::Errc::InvalidRule:
    case util::Errc::MalformedNotification:
    case util::Errc::BadRequest:     return 400;
    case util::Errc::RuleNotFound:
    case util::Errc::RecordNotFound: return 404;
    case util::Errc::DuplicateRule:  return 409;
    default:                         return 500;
  }
}

static HttpResponse json_response(int status, const Json::Value& v) {
  return HttpResponse{status, "application/json", model::write_compact(v)};
}

HttpResponse error_response(const util::Error& err) {
  Json::Value v(Json::objectValue);
  v["error"] = util::errc_name(err.code);
  v["message"] = err.message;
  return json_response(status_for(err.code), v);
}

static HttpResponse ok_status(const char* message) {
  Json::Value v(Json::objectValue);
  v["status"] = "ok";
  v["message"] = message;
  return json_response(200, v);
}

static HttpResponse plain_error(int status, const char* code, const std::string& message) {
  Json::Value v(Json::objectValue);
  v["error"] = code;
  v["message"] = message;
  return json_response(status, v);
}

static HttpResponse not_found(const HttpRequest& req) {
  return plain_error(404, "not_found", "no route for " + req.method + " " + req.path);
}

static HttpResponse method_not_allowed(const HttpRequest& req) {
  return plain_error(405, "method_not_allowed", req.method + " is not supported on " + req.path);
}

static std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= path.size()) {
    auto slash = path.find('/', start);
    if (slash == std::string::npos) slash = path.size();
    if (slash > start) out.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return out;
}

static HttpResponse from_result(const util::Result<void>& r, const char* ok_message) {
  if (!r) return error_response(r.error());
  return ok_status(ok_message);
}

static HttpResponse health() {
  Json::Value v(Json::objectValue);
  v["status"] = "ok";
  v["version"] = kVersion;
  v["timestamp"] = static_cast<Json::Int64>(util::now_epoch_ms());
  return json_response(200, v);
}

static HttpResponse hardware(ApiBackend& backend) {
  auto self = backend.self_node();
  Json::Value metrics(Json::objectValue);
  for (const auto& s : backend.hardware_snapshot()) {
    Json::Value m(Json::objectValue);
    m["value"] = s.value;
    m["timestamp"] = static_cast<Json::Int64>(util::to_epoch_ms(s.timestamp));
    metrics[s.metric_name] = m;
  }
  Json::Value v(Json::objectValue);
  v["node_id"] = self.id;
  v["node_name"] = self.name;
  v["timestamp"] = static_cast<Json::Int64>(util::now_epoch_ms());
  v["metrics"] = metrics;
  return json_response(200, v);
}

static HttpResponse metric_history(const HttpRequest& req, ApiBackend& backend, const std::string& name) {
  size_t points = kDefaultHistoryPoints;
  if (auto p = req.query_param("points")) {
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(p->data(), p->data() + p->size(), n);
    if (ec != std::errc{} || ptr != p->data() + p->size())
      return error_response(util::Error{util::Errc::BadRequest, "points must be a non-negative integer"});
    points = n;
  }
  Json::Value samples(Json::arrayValue);
  for (const auto& s : backend.metric_history(name, points)) samples.append(model::to_json(s));
  Json::Value v(Json::objectValue);
  v["metric_name"] = name;
  v["samples"] = samples;
  return json_response(200, v);
}

static HttpResponse receive_notification(const HttpRequest& req, ApiBackend& backend) {
  auto parsed = model::parse_json(req.body);
  if (!parsed)
    return error_response(util::Error{util::Errc::MalformedNotification, parsed.error().message});
  auto event = model::notification_from_json(*parsed);
  if (!event) return error_response(event.error());
  if (auto r = backend.receive_notification(std::move(*event)); !r) return error_response(r.error());
  return ok_status("Alert received");
}

static HttpResponse add_rule(const HttpRequest& req, ApiBackend& backend) {
  auto parsed = model::parse_json(req.body);
  if (!parsed) return error_response(util::Error{util::Errc::InvalidRule, parsed.error().message});
  auto rule = model::rule_from_json(*parsed);
  if (!rule) return error_response(rule.error());
  auto id = rule->id;
  if (auto r = backend.add_rule(std::move(*rule)); !r) return error_response(r.error());
  for (const auto& stored : backend.rules())
    if (stored.id == id) return json_response(201, model::to_json(stored));
  return ok_status("Rule added");
}

static HttpResponse history(const HttpRequest& req, ApiBackend& backend) {
  auto flag = req.query_param("unacknowledged");
  bool only_unacked = flag && (*flag == "1" || *flag == "true");
  return json_response(200, model::records_to_json(backend.history(only_unacked)));
}

HttpResponse handle_request(const HttpRequest& req, ApiBackend& backend) {
  const auto seg = split_path(req.path);
  const auto& m = req.method;
  const bool get = m == "GET", post = m == "POST", del = m == "DELETE";

  if (m == "OPTIONS") return HttpResponse{204, "text/plain", ""};

  if (seg.size() == 1 && seg[0] == "health") return get ? health() : method_not_allowed(req);
  if (seg.size() == 1 && seg[0] == "node") return get ? json_response(200, model::to_json(backend.self_node())) : method_not_allowed(req);
  if (seg.size() == 1 && seg[0] == "hardware") return get ? hardware(backend) : method_not_allowed(req);

  if (seg.size() >= 1 && seg[0] == "nodes") {
    if (seg.size() == 1) {
      if (!get) return method_not_allowed(req);
      Json::Value arr(Json::arrayValue);
      for (const auto& n : backend.peers()) arr.append(model::to_json(n));
      return json_response(200, arr);
    }
    if (seg.size() == 2) {
      if (!del) return method_not_allowed(req);
      if (!backend.forget_peer(seg[1])) return plain_error(404, "not_found", "no peer '" + seg[1] + "'");
      return ok_status("Peer removed");
    }
  }

  if (seg.size() >= 1 && seg[0] == "metrics") {
    if (!get) return method_not_allowed(req);
    if (seg.size() == 1)
      return HttpResponse{200, "text/plain; version=0.0.4; charset=utf-8",
                          samples_to_prometheus(backend.hardware_snapshot(), backend.self_node())};
    if (seg.size() == 2) return metric_history(req, backend, seg[1]);
  }

  if (seg.size() >= 1 && seg[0] == "rules") {
    if (seg.size() == 1) {
      if (get) {
        Json::Value arr(Json::arrayValue);
        for (const auto& r : backend.rules()) arr.append(model::to_json(r));
        return json_response(200, arr);
      }
      if (post) return add_rule(req, backend);
      return method_not_allowed(req);
    }
    if (seg.size() == 2) {
      if (!del) return method_not_allowed(req);
      return from_result(backend.remove_rule(seg[1]), "Rule removed");
    }
    if (seg.size() == 3 && (seg[2] == "enable" || seg[2] == "disable")) {
      if (!post) return method_not_allowed(req);
      return from_result(backend.toggle_rule(seg[1], seg[2] == "enable"),
                         seg[2] == "enable" ? "Rule enabled" : "Rule disabled");
    }
  }

  if (seg.size() >= 2 && seg[0] == "alerts") {
    if (seg.size() == 2 && seg[1] == "notify") return post ? receive_notification(req, backend) : method_not_allowed(req);
    if (seg.size() == 2 && seg[1] == "history") {
      if (get) return history(req, backend);
      if (del) { backend.clear_history(); return ok_status("History cleared"); }
      return method_not_allowed(req);
    }
    if (seg.size() == 2 && seg[1] == "export") {
      if (!get) return method_not_allowed(req);
      return HttpResponse{200, "application/json", backend.export_history()};
    }
    if (seg.size() == 3 && seg[2] == "ack") {
      if (!post) return method_not_allowed(req);
      return from_result(backend.acknowledge(seg[1]), "Alert acknowledged");
    }
  }

  return not_found(req);
}

} // namespace skynode::app
