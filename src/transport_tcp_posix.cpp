#include "peerlink/transport.hpp"
#include "peerlink/error.hpp"
#include "peerlink/framing.hpp"
#include "peerlink/socket.hpp"

#include <spdlog/fmt/fmt.h>

namespace peerlink {

TcpTransport::TcpTransport(const ConnectorOptions& opts, Observer& obs)
  : opts_(opts), obs_(obs) {}

TcpTransport::~TcpTransport() { close(); }

void TcpTransport::open(const Endpoint& ep, TransportEvents& events) {
  std::lock_guard<std::mutex> life(life_mu_);
  if (closed_) throw ClosedError("tcp transport is closed");
  if (establisher_) throw std::logic_error("tcp transport already opened");
  events_ = &events;
  establisher_ = std::make_unique<Establisher>(opts_, obs_, slot_);
  establisher_->start(ep, [this](int fd, Establisher::Origin origin) {
    on_established(fd, origin);
  });
}

// Runs on the winning accept/dial thread.
void TcpTransport::on_established(int fd, Establisher::Origin origin) {
  if (closed_) return;
  obs_.log(spdlog::level::info, fmt::format("tcp link up ({})", to_string(origin)));
  events_->on_connected();
  reader_ = std::make_unique<StreamReader>(
    fd, opts_, obs_,
    [this](Message&& m) { events_->on_message(std::move(m)); },
    [this](const std::string& reason) { mark_lost(reason); });
  reader_->start();
}

// The link is dead for both ends: the peer sees EOF instead of a silent socket.
void TcpTransport::mark_lost(const std::string& reason) {
  if (lost_.exchange(true)) return;
  slot_.shutdown();
  if (events_) events_->on_lost(reason);
}

void TcpTransport::send(const Message& msg) {
  Bytes frame = encode_frame(msg);
  std::lock_guard<std::mutex> lk(write_mu_);
  if (closed_) throw ClosedError("tcp transport is closed");
  if (lost_) throw ConnectionLostError("tcp connection lost");
  if (!slot_.installed()) throw NotConnectedError("tcp link not established");
  try {
    send_all(slot_.fd(), frame.data(), frame.size());
  } catch (const TransportError& e) {
    if (closed_) throw ClosedError("tcp transport closed during send");
    obs_.log(spdlog::level::err, fmt::format("send '{}' failed: {}", msg.tag, e.what()));
    mark_lost(e.what());
    throw;
  }
}

bool TcpTransport::is_connected() const {
  return slot_.installed() && !lost_ && !closed_;
}

void TcpTransport::close() noexcept {
  std::lock_guard<std::mutex> life(life_mu_);
  if (closed_.exchange(true)) return;
  // loops first, so nothing touches the handle after it is released
  if (establisher_) establisher_->stop();
  if (reader_) reader_->stop();
  slot_.shutdown();
  std::lock_guard<std::mutex> lk(write_mu_);
  slot_.reset();
  obs_.log(spdlog::level::info, "tcp transport closed");
}

} // namespace peerlink
