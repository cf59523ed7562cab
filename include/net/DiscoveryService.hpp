#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "model/Node.hpp"
#include "util/Error.hpp"

namespace skynode::net {

inline constexpr std::string_view kServiceType = "_skynode._udp";
inline constexpr size_t kMaxAnnouncementBytes = 2048;

struct DiscoveryOptions {
  uint16_t udp_port{3031};
  std::chrono::milliseconds interval{5000};
  std::string broadcast_address{"255.255.255.255"};
};

using PeerSeen = std::function<void(model::Node)>;

// LAN presence over UDP broadcast. Every interval the local node announces
// itself; every announcement heard from another node is handed to the
// callback with the sender's address filled in.
class DiscoveryService {
public:
  DiscoveryService(model::Node self, DiscoveryOptions opts, PeerSeen on_peer);
  ~DiscoveryService();
  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  [[nodiscard]] util::Result<void> start();
  void stop();

  // Send one announcement immediately.
  [[nodiscard]] util::Result<void> announce();

  [[nodiscard]] static std::string encode_announcement(const model::Node& self);
  // The sender address comes from the datagram, never from the payload.
  [[nodiscard]] static util::Result<model::Node> decode_announcement(std::string_view payload,
                                                                     std::string_view sender_ip,
                                                                     util::TimePoint now);

private:
  void listen_loop(std::stop_token st);
  void announce_loop(std::stop_token st);

  model::Node self_;
  DiscoveryOptions opts_;
  PeerSeen on_peer_;
  int fd_{-1};
  std::string payload_;
  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
  std::jthread listen_thread_;
  std::jthread announce_thread_;
};

} // namespace skynode::net
