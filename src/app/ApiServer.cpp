#include "app/ApiServer.hpp"
#include "app/ApiRouter.hpp"
#include "net/HttpMessage.hpp"

#ifdef SKYNODE_HAVE_URING
#include <liburing.h>
#endif
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>

namespace skynode::app {

ApiServer::ApiServer(ApiBackend& backend, uint16_t port, std::string bind_address)
    : backend_(backend), port_(port), bind_address_(std::move(bind_address)) {}

ApiServer::~ApiServer() { stop(); }

util::Result<void> ApiServer::start() {
  auto sys_fail = [this](const char* what) {
    std::string msg = std::string(what) + " failed: " + std::strerror(errno);
    close_fds();
    return util::fail(util::Errc::NetworkError, std::move(msg));
  };

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1)
    return util::fail(util::Errc::NetworkError, "invalid bind address '" + bind_address_ + "'");

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) return sys_fail("socket()");

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    char what[64];
    std::snprintf(what, sizeof(what), "bind(%s:%u)", bind_address_.c_str(), static_cast<unsigned>(port_));
    errno = err;
    return sys_fail(what);
  }
  if (::listen(listen_fd_, 16) < 0) return sys_fail("listen()");

  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) return sys_fail("getsockname()");
  bound_port_ = ntohs(addr.sin_port);

  // Create eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) return sys_fail("eventfd()");

  std::fprintf(stderr, "skynode: api server listening on %s:%u\n", bind_address_.c_str(),
               static_cast<unsigned>(bound_port_));
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return {};
}

void ApiServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  close_fds();
}

void ApiServer::close_fds() {
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

#ifdef SKYNODE_HAVE_URING

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

void ApiServer::run(std::stop_token st) {
  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "skynode: api server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) break;

    if (tag == UringTag::ListenPoll && res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
}

#else

void ApiServer::run(std::stop_token st) {
  struct pollfd fds[2] = {
    {.fd = listen_fd_, .events = POLLIN, .revents = 0},
    {.fd = stop_eventfd_, .events = POLLIN, .revents = 0},
  };

  while (!st.stop_requested()) {
    int ret = ::poll(fds, 2, -1);
    if (ret < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "skynode: api server: poll() failed: %s\n", std::strerror(errno));
      break;
    }
    if ((fds[1].revents & POLLIN) || st.stop_requested()) break;
    if (fds[0].revents & POLLIN) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
    }
  }
}

#endif // SKYNODE_HAVE_URING

void ApiServer::handle_client(int fd) {
  // Set timeouts to prevent slow clients from blocking the server
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  std::string raw;
  char buf[4096];
  std::optional<size_t> hend;
  size_t want = 0;
  net::HttpResponse resp;
  bool have_resp = false;

  while (true) {
    if (hend && raw.size() >= *hend + want) break;
    ssize_t nr = ::recv(fd, buf, sizeof(buf), 0);
    if (nr < 0 && errno == EINTR) continue;
    if (nr <= 0) {
      if (raw.empty()) return;
      resp = error_response(util::Error{util::Errc::BadRequest, "connection closed mid-request"});
      have_resp = true;
      break;
    }
    raw.append(buf, static_cast<size_t>(nr));

    if (!hend) {
      hend = net::header_end(raw);
      if (!hend) {
        if (raw.size() > net::kMaxHeaderBytes) {
          resp = error_response(util::Error{util::Errc::BadRequest, "request headers too large"});
          have_resp = true;
          break;
        }
        continue;
      }
      auto len = net::content_length(std::string_view(raw).substr(0, *hend));
      if (!len) {
        resp = error_response(len.error());
        have_resp = true;
        break;
      }
      want = *len;
    }
  }

  if (!have_resp) {
    auto req = net::parse_request(raw);
    try {
      resp = req ? handle_request(*req, backend_) : error_response(req.error());
    } catch (const std::exception& e) {
      std::fprintf(stderr, "skynode: api server: request failed: %s\n", e.what());
      resp = error_response(util::Error{util::Errc::Internal, e.what()});
    }
  }

  // Send response via scatter-gather (headers + body, no concatenation)
  std::string head = net::format_response_head(resp);
  struct iovec iov[2] = {
    {.iov_base = head.data(), .iov_len = head.size()},
    {.iov_base = resp.body.data(), .iov_len = resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  size_t total = head.size() + resp.body.size();
  size_t sent = 0;
  while (sent < total) {
    ssize_t n = ::sendmsg(fd, &msg, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;
    sent += static_cast<size_t>(n);
    // Advance the iovecs past what the kernel accepted
    size_t skip = static_cast<size_t>(n);
    while (msg.msg_iovlen > 0 && skip >= msg.msg_iov[0].iov_len) {
      skip -= msg.msg_iov[0].iov_len;
      ++msg.msg_iov;
      --msg.msg_iovlen;
    }
    if (msg.msg_iovlen > 0) {
      msg.msg_iov[0].iov_base = static_cast<char*>(msg.msg_iov[0].iov_base) + skip;
      msg.msg_iov[0].iov_len -= skip;
    }
  }
}

} // namespace skynode::app
