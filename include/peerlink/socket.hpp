#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace peerlink {

// Owns one file descriptor. Move-only.
class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) noexcept : fd_(fd) {}
  ~Socket();
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& o) noexcept;
  Socket& operator=(Socket&& o) noexcept;

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }
  int release() noexcept;
  void reset() noexcept;

private:
  int fd_{-1};
};

// Bound, listening TCP socket. Throws TransportError.
Socket listen_tcp(const std::string& bind_host, std::uint16_t port);

// One outbound attempt bounded by timeout. On failure returns an empty Socket
// and fills in why.
Socket try_dial_tcp(const std::string& host, std::uint16_t port,
                    std::chrono::milliseconds timeout, std::string& why);

// Blocking exact send. Throws TransportError.
void send_all(int fd, const std::uint8_t* data, std::size_t n);

std::string errno_string(int err);

} // namespace peerlink
