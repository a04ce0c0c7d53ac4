#include "dropwire/transport.hpp"
#include "dropwire/errors.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace dropwire {

static int poll_timeout_ms(Millis timeout) {
  return timeout.count() < 0 ? -1 : (int)timeout.count();
}

static bool set_nonblocking(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

// Non-blocking connect bounded by poll(); returns the fd in blocking mode.
static int connect_one(const struct addrinfo* ai, Millis timeout) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) return -1;
  if (!set_nonblocking(fd, true)) { ::close(fd); return -1; }

  int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
  if (rc != 0 && errno == EINPROGRESS) {
    struct pollfd pfd{fd, POLLOUT, 0};
    rc = ::poll(&pfd, 1, poll_timeout_ms(timeout));
    if (rc == 1) {
      int err = 0;
      socklen_t len = sizeof(err);
      rc = (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) ? 0 : -1;
    } else {
      rc = -1;
    }
  }
  if (rc != 0 || !set_nonblocking(fd, false)) { ::close(fd); return -1; }
  return fd;
}

static int connect_tcp(const std::string& host, std::uint16_t port, Millis timeout) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  ensure(rc == 0 && res, ErrorKind::Transport, "getaddrinfo failed");

  int fd = -1;
  for (auto* p = res; p; p = p->ai_next) {
    fd = connect_one(p, timeout);
    if (fd >= 0) break;
  }
  ::freeaddrinfo(res);
  if (fd < 0) {
    fail(ErrorKind::Transport, "TCP connect to " + host + ":" + port_str + " failed");
  }
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                         port_str.c_str(), &hints, &res);
  ensure(rc == 0 && res, ErrorKind::Transport, "getaddrinfo(bind) failed");

  int lfd = -1;
  for (auto* p = res; p; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) continue;

    int yes = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(lfd, p->ai_addr, p->ai_addrlen) != 0) { ::close(lfd); lfd = -1; continue; }
    if (::listen(lfd, 16) != 0) { ::close(lfd); lfd = -1; continue; }
    break;
  }
  ::freeaddrinfo(res);
  if (lfd < 0) fail(ErrorKind::Transport, "TCP listen on port " + port_str + " failed");
  return lfd;
}

// ------------------------------ TcpTransport ------------------------------

TcpTransport::TcpTransport() = default;
TcpTransport::TcpTransport(int connected_fd) : fd_(connected_fd) {}
TcpTransport::~TcpTransport() { close(); }

void TcpTransport::connect(const std::string& host, std::uint16_t port, Millis timeout) {
  close();
  fd_ = connect_tcp(host, port, timeout);
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure(fd_ >= 0, ErrorKind::Transport, "send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    if (w <= 0) fail(ErrorKind::Transport, std::string("send failed: ") + std::strerror(errno));
    off += (std::size_t)w;
  }
}

std::size_t TcpTransport::recv_some(std::uint8_t* out, std::size_t n, Millis timeout) {
  ensure(fd_ >= 0, ErrorKind::Transport, "recv on closed socket");
  for (;;) {
    struct pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, poll_timeout_ms(timeout));
    if (rc < 0 && errno == EINTR) continue;
    ensure(rc >= 0, ErrorKind::Transport, "poll failed");
    if (rc == 0) return 0;

    ssize_t r = ::recv(fd_, out, n, 0);
    if (r < 0 && errno == EINTR) continue;
    ensure(r != 0, ErrorKind::Transport, "connection closed by peer");
    if (r < 0) fail(ErrorKind::Transport, std::string("recv failed: ") + std::strerror(errno));
    return (std::size_t)r;
  }
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

std::string TcpTransport::peer_address() const {
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (fd_ < 0 || ::getpeername(fd_, (struct sockaddr*)&ss, &len) != 0) return "?";

  char host[NI_MAXHOST] = {0};
  char serv[NI_MAXSERV] = {0};
  if (::getnameinfo((struct sockaddr*)&ss, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  return std::string(host) + ":" + serv;
}

// ------------------------------ TcpListener ------------------------------

TcpListener::~TcpListener() { close(); }

void TcpListener::listen(const std::string& bind_host, std::uint16_t port) {
  close();
  fd_ = listen_tcp(bind_host, port);
}

std::unique_ptr<TcpTransport> TcpListener::accept(Millis timeout) {
  ensure(fd_ >= 0, ErrorKind::Transport, "accept on closed listener");
  for (;;) {
    struct pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, poll_timeout_ms(timeout));
    if (rc < 0 && errno == EINTR) continue;
    ensure(rc >= 0, ErrorKind::Transport, "poll failed");
    if (rc == 0) return nullptr;

    int cfd = ::accept(fd_, nullptr, nullptr);
    if (cfd < 0 && (errno == EINTR || errno == ECONNABORTED)) continue;
    ensure(cfd >= 0, ErrorKind::Transport, "accept failed");
    return std::make_unique<TcpTransport>(cfd);
  }
}

std::uint16_t TcpListener::local_port() const {
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  ensure(fd_ >= 0 && ::getsockname(fd_, (struct sockaddr*)&ss, &len) == 0,
         ErrorKind::Transport, "getsockname failed");
  if (ss.ss_family == AF_INET6) return ntohs(((struct sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((struct sockaddr_in*)&ss)->sin_port);
}

void TcpListener::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

} // namespace dropwire
