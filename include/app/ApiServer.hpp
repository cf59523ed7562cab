#pragma once

#include <cstdint>
#include <string>
#include <thread>

#include "app/ApiBackend.hpp"
#include "util/Error.hpp"

namespace skynode::app {

// Single-threaded HTTP/1.1 listener serving the node API. Each connection
// carries one request and is closed after the response. Driven by io_uring
// when built with SKYNODE_HAVE_URING, by poll(2) otherwise.
class ApiServer {
public:
  ApiServer(ApiBackend& backend, uint16_t port, std::string bind_address = "0.0.0.0");
  ~ApiServer();
  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  // Binds and listens on the calling thread so port conflicts surface here,
  // then serves on a background thread. Port 0 picks an ephemeral port.
  [[nodiscard]] util::Result<void> start();
  void stop();

  [[nodiscard]] uint16_t bound_port() const { return bound_port_; }

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);
  void close_fds();

  ApiBackend& backend_;
  uint16_t port_;
  std::string bind_address_;
  uint16_t bound_port_{0};
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace skynode::app
