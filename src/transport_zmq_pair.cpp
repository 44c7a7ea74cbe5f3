#include "peerlink/zmq_transport.hpp"
#include "peerlink/error.hpp"
#include "peerlink/framing.hpp"

#include <spdlog/fmt/fmt.h>
#include <zmq_addon.hpp>

#include <cstdint>
#include <iterator>

namespace peerlink {

ZmqPairTransport::ZmqPairTransport(const ConnectorOptions& opts, Observer& obs)
  : opts_(opts), obs_(obs) {}

ZmqPairTransport::~ZmqPairTransport() { close(); }

void ZmqPairTransport::open(const Endpoint& ep, TransportEvents& events) {
  std::lock_guard<std::mutex> life(life_mu_);
  if (closed_) throw ClosedError("zmq transport is closed");
  if (bound_) throw std::logic_error("zmq transport already opened");
  events_ = &events;

  const std::string bind_addr = fmt::format("tcp://{}:{}",
      opts_.bind_host.empty() ? "*" : opts_.bind_host, ep.listen_port);
  const std::string connect_addr = fmt::format("tcp://{}:{}", ep.peer_host, ep.peer_port);
  // payload cap plus the tag part
  const std::int64_t max_msg = (std::int64_t)(opts_.max_frame_size + kMaxTagSize);

  try {
    bind_sock_ = zmq::socket_t(ctx_, zmq::socket_type::pair);
    bind_sock_.set(zmq::sockopt::linger, 0);
    bind_sock_.set(zmq::sockopt::maxmsgsize, max_msg);
    bind_sock_.bind(bind_addr);
    bound_ = true;
    obs_.log(spdlog::level::info, "pair socket bound to " + bind_addr);

    connect_sock_ = zmq::socket_t(ctx_, zmq::socket_type::pair);
    connect_sock_.set(zmq::sockopt::linger, 0);
    // sends wait (bounded) for the peer instead of queueing for an absent one
    connect_sock_.set(zmq::sockopt::immediate, 1);
    connect_sock_.set(zmq::sockopt::sndtimeo, (int)opts_.connect_wait.count());
    connect_sock_.connect(connect_addr);
    connected_ = true;
    obs_.log(spdlog::level::info, "pair socket connected to " + connect_addr);
  } catch (const zmq::error_t& e) {
    throw TransportError(fmt::format("zmq open {} / {} failed: {}", bind_addr, connect_addr, e.what()));
  }

  dispatcher_ = std::thread([this] { dispatch_loop(); });
  events_->on_connected();
}

void ZmqPairTransport::dispatch_loop() {
  std::vector<zmq::pollitem_t> items = {{bind_sock_.handle(), 0, ZMQ_POLLIN, 0}};
  while (!stop_) {
    try {
      items[0].revents = 0;
      zmq::poll(items, opts_.poll_interval);
      if ((items[0].revents & ZMQ_POLLIN) == 0) continue;

      std::vector<zmq::message_t> parts;
      auto got = zmq::recv_multipart(bind_sock_, std::back_inserter(parts),
                                     zmq::recv_flags::dontwait);
      if (!got) continue;
      deliver(parts);
    } catch (const zmq::error_t& e) {
      if (stop_ || e.num() == ETERM) return;
      obs_.log(spdlog::level::err, std::string("pair dispatcher error: ") + e.what());
      mark_lost(e.what());
      return;
    } catch (const FramingError& e) {
      obs_.log(spdlog::level::err, std::string("pair framing error: ") + e.what());
      mark_lost(std::string("framing error: ") + e.what());
      return;
    }
  }
}

void ZmqPairTransport::deliver(std::vector<zmq::message_t>& parts) {
  if (parts.empty() || parts.size() > 2)
    throw FramingError(fmt::format("expected tag and payload parts, got {} parts", parts.size()));
  const zmq::message_t& tag = parts[0];
  Message msg = parts.size() == 2
    ? message_from_parts(tag.data(), tag.size(), parts[1].data(), parts[1].size(), opts_.max_frame_size)
    : message_from_parts(tag.data(), tag.size(), nullptr, 0, opts_.max_frame_size);
  obs_.log(spdlog::level::debug,
           fmt::format("received '{}', {} payload bytes", msg.tag, msg.payload.size()));
  peer_seen_ = true;
  events_->on_message(std::move(msg));
}

void ZmqPairTransport::mark_lost(const std::string& reason) {
  if (lost_.exchange(true)) return;
  if (events_) events_->on_lost(reason);
}

void ZmqPairTransport::send(const Message& msg) {
  if (msg.tag.size() > kMaxTagSize || msg.payload.size() > opts_.max_frame_size)
    throw FramingError(fmt::format("message '{}' exceeds frame limits", msg.tag));

  std::lock_guard<std::mutex> lk(send_mu_);
  if (closed_) throw ClosedError("zmq transport is closed");
  if (lost_) throw ConnectionLostError("zmq connection lost");
  if (!connected_) throw NotConnectedError("pair socket not connected");
  try {
    auto sent = connect_sock_.send(zmq::buffer(msg.tag), zmq::send_flags::sndmore);
    if (sent) sent = connect_sock_.send(zmq::buffer(msg.payload), zmq::send_flags::none);
    if (!sent) {
      // the pipe exists only once the peer's socket is up; a full one means it stopped reading
      if (peer_seen_)
        throw TransportError(fmt::format("peer is not draining, '{}' not taken within {} ms",
                                         msg.tag, opts_.connect_wait.count()));
      throw NotConnectedError(fmt::format("peer did not take '{}' within {} ms", msg.tag,
                                          opts_.connect_wait.count()));
    }
    peer_seen_ = true;
  } catch (const zmq::error_t& e) {
    if (closed_ || e.num() == ETERM) throw ClosedError("zmq transport closed during send");
    obs_.log(spdlog::level::err, fmt::format("send '{}' failed: {}", msg.tag, e.what()));
    mark_lost(e.what());
    throw TransportError(std::string("zmq send failed: ") + e.what());
  }
}

bool ZmqPairTransport::is_connected() const {
  return bound_ && connected_ && !lost_ && !closed_;
}

void ZmqPairTransport::close() noexcept {
  std::lock_guard<std::mutex> life(life_mu_);
  if (closed_.exchange(true)) return;
  stop_ = true;
  // unblocks the dispatcher poll and any sender waiting on its timeout
  ctx_.shutdown();
  if (dispatcher_.joinable()) dispatcher_.join();
  std::lock_guard<std::mutex> lk(send_mu_);
  bind_sock_.close();
  connect_sock_.close();
  ctx_.close();
  bound_ = false;
  connected_ = false;
  obs_.log(spdlog::level::info, "zmq transport closed");
}

} // namespace peerlink
