#include "peerlink/socket.hpp"
#include "peerlink/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace peerlink {

Socket::~Socket() { reset(); }

Socket::Socket(Socket&& o) noexcept : fd_(o.release()) {}

Socket& Socket::operator=(Socket&& o) noexcept {
  if (this != &o) {
    reset();
    fd_ = o.release();
  }
  return *this;
}

int Socket::release() noexcept {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

void Socket::reset() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

std::string errno_string(int err) {
  return std::system_category().message(err);
}

static void set_nodelay(int fd) {
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

static bool set_nonblocking(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

Socket listen_tcp(const std::string& bind_host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                         port_str.c_str(), &hints, &res);
  if (rc != 0 || !res)
    throw TransportError(fmt::format("resolve {}:{} failed: {}", bind_host, port, ::gai_strerror(rc)));

  int last_err = 0;
  Socket lfd;
  for (auto* p = res; p; p = p->ai_next) {
    Socket s(::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol));
    if (!s.valid()) { last_err = errno; continue; }

    int yes = 1;
    ::setsockopt(s.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(s.get(), p->ai_addr, p->ai_addrlen) != 0) { last_err = errno; continue; }
    if (::listen(s.get(), 16) != 0) { last_err = errno; continue; }
    lfd = std::move(s);
    break;
  }
  ::freeaddrinfo(res);
  if (!lfd.valid())
    throw TransportError(fmt::format("listen on port {} failed: {}", port, errno_string(last_err)));
  return lfd;
}

// Non-blocking connect bounded by timeout; the socket is blocking again on success.
static bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t len,
                                 std::chrono::milliseconds timeout, int& err) {
  if (!set_nonblocking(fd, true)) { err = errno; return false; }

  if (::connect(fd, addr, len) != 0) {
    if (errno != EINPROGRESS) { err = errno; return false; }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    int ret = ::poll(&pfd, 1, (int)timeout.count());
    if (ret == 0) { err = ETIMEDOUT; return false; }
    if (ret < 0) { err = errno; return false; }

    int so_err = 0;
    socklen_t so_len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) != 0) { err = errno; return false; }
    if (so_err != 0) { err = so_err; return false; }
  }
  if (!set_nonblocking(fd, false)) { err = errno; return false; }
  return true;
}

Socket try_dial_tcp(const std::string& host, std::uint16_t port,
                    std::chrono::milliseconds timeout, std::string& why) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    why = fmt::format("resolve {} failed: {}", host, ::gai_strerror(rc));
    return Socket();
  }

  Socket out;
  int err = 0;
  for (auto* p = res; p; p = p->ai_next) {
    Socket s(::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol));
    if (!s.valid()) { err = errno; continue; }
    if (connect_with_timeout(s.get(), p->ai_addr, p->ai_addrlen, timeout, err)) {
      out = std::move(s);
      break;
    }
  }
  ::freeaddrinfo(res);
  if (!out.valid()) {
    why = errno_string(err);
    return out;
  }
  set_nodelay(out.get());
  return out;
}

void send_all(int fd, const std::uint8_t* data, std::size_t n) {
  if (fd < 0) throw TransportError("send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    if (w <= 0) throw TransportError("send failed: " + errno_string(errno));
    off += (std::size_t)w;
  }
}

} // namespace peerlink
