#include "util/HostInfo.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>
#include <uuid/uuid.h>

#include <fstream>

namespace skynode::util {

std::string make_uuid() {
  uuid_t raw;
  uuid_generate_random(raw);
  char buf[37];
  uuid_unparse_lower(raw, buf);
  return std::string(buf);
}

std::string host_name() {
  char buf[256]{};
  if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "skynode";
  return std::string(buf);
}

std::string os_info() {
  std::ifstream in("/etc/os-release");
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind("PRETTY_NAME=", 0) != 0) continue;
    auto v = line.substr(12);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
    if (!v.empty()) return v;
  }
  struct utsname u{};
  if (::uname(&u) == 0) return std::string(u.sysname) + " " + u.release;
  return "Linux";
}

std::string primary_ipv4() {
  struct ifaddrs* ifs = nullptr;
  if (::getifaddrs(&ifs) != 0) return "127.0.0.1";
  std::string out = "127.0.0.1";
  for (auto* it = ifs; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if (it->ifa_flags & IFF_LOOPBACK) continue;
    if (!(it->ifa_flags & IFF_UP)) continue;
    char buf[INET_ADDRSTRLEN]{};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) { out = buf; break; }
  }
  ::freeifaddrs(ifs);
  return out;
}

} // namespace skynode::util
