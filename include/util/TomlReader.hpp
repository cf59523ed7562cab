#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace skynode::util {

// Reader for the flat subset of TOML the daemon config uses: [section]
// headers, key = value pairs, quoted strings and one-line string arrays.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = strip_comment(trim(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (is_quoted(val)) val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto val = get_string(section, key);
    if (val.empty()) return def;
    int v = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return v;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    auto val = get_string(section, key);
    if (val.empty()) return def;
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return v;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    auto val = get_string(section, key);
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // ["a", "b"] -> {"a", "b"}. A bare scalar is treated as a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    auto val = get_string(section, key);
    std::string_view sv(val);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') sv = sv.substr(1, sv.size() - 2);
    while (!sv.empty()) {
      auto comma = sv.find(',');
      auto item = trim(sv.substr(0, comma));
      if (item.size() >= 2 && item.front() == '"' && item.back() == '"') item = item.substr(1, item.size() - 2);
      if (!item.empty()) out.emplace_back(item);
      if (comma == std::string_view::npos) break;
      sv.remove_prefix(comma + 1);
    }
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing "# comment" that is not inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool in_str = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_str = !in_str;
      else if (sv[i] == '#' && !in_str) return trim(sv.substr(0, i));
    }
    return sv;
  }

  static bool is_quoted(const std::string& val) {
    return val.size() >= 2 && val.front() == '"' && val.back() == '"';
  }
};

} // namespace skynode::util
