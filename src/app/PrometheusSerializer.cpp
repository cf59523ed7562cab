#include "app/PrometheusSerializer.hpp"
#include "app/Version.hpp"
#include <charconv>
#include <cmath>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

// Metric names may only carry [a-zA-Z0-9_:].
void append_metric_name(std::string& out, std::string_view name) {
  out += "skynode_";
  for (char c : name) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
    out += ok ? c : '_';
  }
}

void emit_header(std::string& out, std::string_view metric, std::string_view help, const char* type) {
  out += "# HELP ";  append_metric_name(out, metric);  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  append_metric_name(out, metric);  out += ' ';  out += type;  out += '\n';
}

// 1-label variant: name{key="val"} value
void emit_labeled_d(std::string& out, std::string_view metric,
                    const char* lk, std::string_view lv, double value) {
  append_metric_name(out, metric);  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

std::string help_for(std::string_view name) {
  std::string help = "Latest ";
  help += name;
  if (const auto* info = skynode::model::find_metric(name)) {
    help += " sample (";
    help += skynode::model::to_string(info->family);
    help += ')';
  } else {
    help += " sample";
  }
  return help;
}

} // anonymous namespace

namespace skynode::app {

std::string samples_to_prometheus(const std::vector<model::MetricSample>& samples, const model::Node& self) {
  std::string out;
  out.reserve(256 + samples.size() * 160);

  // Info gauge carries the node metadata once; per-metric series only the id.
  out += "# HELP skynode_node_info Node identity\n# TYPE skynode_node_info gauge\n";
  out += "skynode_node_info{node=\"";  append_escaped(out, self.id);
  out += "\",name=\"";                 append_escaped(out, self.name);
  out += "\",version=\"";              append_escaped(out, kVersion);
  out += "\"} 1\n";

  for (const auto& s : samples) {
    if (!std::isfinite(s.value)) continue;
    emit_header(out, s.metric_name, help_for(s.metric_name), "gauge");
    emit_labeled_d(out, s.metric_name, "node", self.id, s.value);
  }
  return out;
}

} // namespace skynode::app
