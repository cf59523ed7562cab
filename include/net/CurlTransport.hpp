#pragma once

#include "app/NotificationBroadcaster.hpp"

namespace skynode::net {

// Process-wide libcurl setup. Call once from main before any thread starts
// a transfer; the guard object tears it down on scope exit.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

  [[nodiscard]] bool ok() const { return ok_; }

private:
  bool ok_{false};
};

// POSTs notification JSON to <peer api_url>/alerts/notify with one easy
// handle per call, so concurrent deliveries share nothing.
class CurlTransport : public app::PeerTransport {
public:
  [[nodiscard]] util::Result<void> post_notification(const model::Node& peer, const std::string& body,
                                                     std::chrono::milliseconds timeout) override;
};

} // namespace skynode::net
