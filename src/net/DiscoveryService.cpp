#include "net/DiscoveryService.hpp"
#include "model/Json.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace skynode::net {

DiscoveryService::DiscoveryService(model::Node self, DiscoveryOptions opts, PeerSeen on_peer)
    : self_(std::move(self)), opts_(std::move(opts)), on_peer_(std::move(on_peer)),
      payload_(encode_announcement(self_)) {}

DiscoveryService::~DiscoveryService() { stop(); }

std::string DiscoveryService::encode_announcement(const model::Node& self) {
  Json::Value v(Json::objectValue);
  v["service"] = std::string(kServiceType);
  v["id"] = self.id;
  v["name"] = self.name;
  v["api_port"] = static_cast<Json::UInt>(self.api_port);
  v["os_info"] = self.os_info;
  v["version"] = self.version;
  return model::write_compact(v);
}

util::Result<model::Node> DiscoveryService::decode_announcement(std::string_view payload, std::string_view sender_ip,
                                                                util::TimePoint now) {
  auto bad = [](std::string msg) { return util::fail(util::Errc::BadRequest, "announcement: " + std::move(msg)); };
  if (payload.size() > kMaxAnnouncementBytes) return bad("too large");
  auto parsed = model::parse_json(payload);
  if (!parsed) return bad(parsed.error().message);
  const auto& v = *parsed;
  if (!v.isObject()) return bad("not an object");
  if (!v["service"].isString() || v["service"].asString() != kServiceType) return bad("foreign service type");
  if (!v["id"].isString() || v["id"].asString().empty()) return bad("missing id");
  if (!v["api_port"].isIntegral()) return bad("missing api_port");
  if (!v["api_port"].isInt64()) return bad("api_port out of range");
  auto port = v["api_port"].asInt64();
  if (port < 1 || port > 65535) return bad("api_port out of range");

  model::Node n;
  n.id = v["id"].asString();
  n.name = v["name"].isString() && !v["name"].asString().empty() ? v["name"].asString() : n.id;
  n.ip_address = std::string(sender_ip);
  n.api_port = static_cast<uint16_t>(port);
  n.os_info = v["os_info"].isString() ? v["os_info"].asString() : "";
  n.version = v["version"].isString() ? v["version"].asString() : "";
  n.status = model::NodeStatus::Online;
  n.last_seen = now;
  return n;
}

util::Result<void> DiscoveryService::start() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) return util::fail(util::Errc::NetworkError, std::string("udp socket() failed: ") + std::strerror(errno));

  auto fail_close = [this](const char* what) {
    std::string msg = std::string(what) + " failed: " + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return util::fail(util::Errc::NetworkError, std::move(msg));
  };

  int one = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0) return fail_close("SO_BROADCAST");
  // Several nodes on one host share the discovery port.
  (void)::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  (void)::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(opts_.udp_port);
  addr.sin_addr.s_addr = INADDR_ANY;
  if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) return fail_close("udp bind()");

  std::fprintf(stderr, "skynode: discovery: listening on udp :%u, announcing every %lldms\n",
               static_cast<unsigned>(opts_.udp_port), static_cast<long long>(opts_.interval.count()));
  listen_thread_ = std::jthread([this](std::stop_token st){ listen_loop(st); });
  announce_thread_ = std::jthread([this](std::stop_token st){ announce_loop(st); });
  return {};
}

void DiscoveryService::stop() {
  if (listen_thread_.joinable()) { listen_thread_.request_stop(); }
  if (announce_thread_.joinable()) { announce_thread_.request_stop(); }
  wait_cv_.notify_all();
  if (listen_thread_.joinable()) listen_thread_.join();
  if (announce_thread_.joinable()) announce_thread_.join();
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

util::Result<void> DiscoveryService::announce() {
  if (fd_ < 0) return util::fail(util::Errc::NetworkError, "discovery socket not open");
  struct sockaddr_in dst{};
  dst.sin_family = AF_INET;
  dst.sin_port = htons(opts_.udp_port);
  if (::inet_pton(AF_INET, opts_.broadcast_address.c_str(), &dst.sin_addr) != 1)
    return util::fail(util::Errc::NetworkError, "invalid broadcast address '" + opts_.broadcast_address + "'");
  ssize_t n = ::sendto(fd_, payload_.data(), payload_.size(), 0, reinterpret_cast<struct sockaddr*>(&dst), sizeof(dst));
  if (n < 0) return util::fail(util::Errc::NetworkError, std::string("sendto() failed: ") + std::strerror(errno));
  return {};
}

void DiscoveryService::announce_loop(std::stop_token st) {
  uint64_t failures = 0;
  while (!st.stop_requested()) {
    if (auto r = announce(); !r) {
      // First failure and then once a minute at the default cadence
      if (failures++ % 12 == 0)
        std::fprintf(stderr, "skynode: discovery: %s\n", r.error().message.c_str());
    } else {
      failures = 0;
    }
    std::unique_lock lk(wait_mu_);
    wait_cv_.wait_for(lk, st, opts_.interval, []{ return false; });
  }
}

void DiscoveryService::listen_loop(std::stop_token st) {
  char buf[kMaxAnnouncementBytes + 1];
  while (!st.stop_requested()) {
    struct pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int ret = ::poll(&pfd, 1, 1000);
    if (ret < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "skynode: discovery: poll() failed: %s\n", std::strerror(errno));
      return;
    }
    if (ret == 0 || !(pfd.revents & POLLIN)) continue;

    struct sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<struct sockaddr*>(&from), &from_len);
    if (n <= 0) continue;

    char ip[INET_ADDRSTRLEN] = {};
    if (!::inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip))) continue;

    auto node = decode_announcement(std::string_view(buf, static_cast<size_t>(n)), ip, util::Clock::now());
    if (!node) continue;  // foreign or garbled datagrams are expected on a shared port
    if (node->id == self_.id) continue;
    if (on_peer_) on_peer_(std::move(*node));
  }
}

} // namespace skynode::net
