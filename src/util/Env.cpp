#include "util/Env.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace skynode::util {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SKYNODE_", 0) == 0) {
    alt = std::string("skynode_") + n.substr(8);
  } else if (n.rfind("skynode_", 0) == 0) {
    alt = std::string("SKYNODE_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  int out = 0;
  const char* end = v + std::strlen(v);
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc{} || ptr != end) return defv;
  return out;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/skynode/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/skynode/config.toml";
  return {};
}

std::string default_data_dir() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return std::string(xdg) + "/skynode";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/share/skynode";
  return "/var/lib/skynode";
}

} // namespace skynode::util
