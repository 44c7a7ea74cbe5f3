#include "peerlink/establisher.hpp"
#include "peerlink/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

namespace peerlink {

const char* to_string(Establisher::Origin o) {
  return o == Establisher::Origin::Inbound ? "inbound" : "outbound";
}

// ------------------------------ SocketSlot ------------------------------

bool SocketSlot::try_install(Socket& s) noexcept {
  if (!s.valid()) return false;
  int expected = kEmpty;
  if (!fd_.compare_exchange_strong(expected, s.get())) return false;
  s.release();
  return true;
}

void SocketSlot::shutdown() noexcept {
  int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void SocketSlot::reset() noexcept {
  int fd = fd_.exchange(kRetired);
  if (fd >= 0) ::close(fd);
}

// ------------------------------ Establisher ------------------------------

Establisher::Establisher(const ConnectorOptions& opts, Observer& obs, SocketSlot& slot)
  : opts_(opts), obs_(obs), slot_(slot) {}

Establisher::~Establisher() { stop(); }

void Establisher::start(const Endpoint& ep, WonHandler on_won) {
  if (accept_thread_.joinable() || dial_thread_.joinable())
    throw std::logic_error("establisher already started");

  ep_ = ep;
  on_won_ = std::move(on_won);
  listener_ = listen_tcp(opts_.bind_host, ep_.listen_port);
  obs_.log(spdlog::level::info, fmt::format("listening on port {}", ep_.listen_port));

  accept_thread_ = std::thread([this] { accept_loop(); });
  dial_thread_ = std::thread([this] { dial_loop(); });
}

void Establisher::stop() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (accept_thread_.joinable()) accept_thread_.join();
  if (dial_thread_.joinable()) dial_thread_.join();
  listener_.reset();
}

bool Establisher::sleep_unless_stopped(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mu_);
  return !cv_.wait_for(lk, d, [this] { return stop_.load(); });
}

void Establisher::settle(Socket s, Origin origin) {
  if (slot_.try_install(s)) {
    obs_.log(spdlog::level::info,
             fmt::format("{} connection on port {} won the race", to_string(origin),
                         origin == Origin::Inbound ? ep_.listen_port : ep_.peer_port));
    if (on_won_) on_won_(slot_.fd(), origin);
  } else {
    obs_.log(spdlog::level::warn,
             fmt::format("discarding {} connection, link already established", to_string(origin)));
  }
  // s closes here if it lost
}

void Establisher::accept_loop() {
  obs_.log(spdlog::level::debug, fmt::format("waiting for inbound connection on port {}", ep_.listen_port));
  while (!stop_ && !slot_.installed() && !slot_.retired()) {
    pollfd pfd{};
    pfd.fd = listener_.get();
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, (int)opts_.poll_interval.count());
    if (ret == 0) continue;
    if (ret < 0) {
      if (errno == EINTR) continue;
      obs_.log(spdlog::level::err, "accept poll failed: " + errno_string(errno));
      break;
    }

    Socket client(::accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC));
    if (!client.valid()) {
      int err = errno;
      if (err == EINTR || err == EAGAIN || err == ECONNABORTED) continue;
      if (!stop_) obs_.log(spdlog::level::err, "accept failed: " + errno_string(err));
      break;
    }
    int one = 1;
    ::setsockopt(client.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    obs_.log(spdlog::level::info, fmt::format("accepted inbound connection on port {}", ep_.listen_port));
    settle(std::move(client), Origin::Inbound);
    break;
  }
  // only one peer is expected; stop accepting
  listener_.reset();
}

void Establisher::dial_loop() {
  while (!stop_ && !slot_.installed() && !slot_.retired()) {
    obs_.log(spdlog::level::debug,
             fmt::format("dialing {}:{}", ep_.peer_host, ep_.peer_port));
    std::string why;
    Socket s = try_dial_tcp(ep_.peer_host, ep_.peer_port, opts_.dial_timeout, why);
    if (s.valid()) {
      obs_.log(spdlog::level::info,
               fmt::format("outbound connection to {}:{} established", ep_.peer_host, ep_.peer_port));
      settle(std::move(s), Origin::Outbound);
      break;
    }
    obs_.log(spdlog::level::debug,
             fmt::format("dial {}:{} failed ({}), will retry", ep_.peer_host, ep_.peer_port, why));
    if (!sleep_unless_stopped(opts_.retry_backoff)) break;
  }
}

} // namespace peerlink
