#pragma once
#include "observer.hpp"
#include "options.hpp"
#include "peerlink.hpp"
#include "transport.hpp"

#include <zmq.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {

// Two ZeroMQ PAIR sockets: one bound on the listen port (inbound), one
// connected to the peer's listen port (outbound). Framing is native to the
// library, so a message is two parts: tag, payload.
class ZmqPairTransport final : public ITransport {
public:
  ZmqPairTransport(const ConnectorOptions& opts, Observer& obs);
  ~ZmqPairTransport() override;

  void open(const Endpoint& ep, TransportEvents& events) override;
  void send(const Message& msg) override;
  bool is_connected() const override;
  void close() noexcept override;

private:
  void dispatch_loop();
  void deliver(std::vector<zmq::message_t>& parts);
  void mark_lost(const std::string& reason);

  const ConnectorOptions opts_;
  Observer& obs_;
  TransportEvents* events_{nullptr};
  zmq::context_t ctx_;
  zmq::socket_t bind_sock_;
  zmq::socket_t connect_sock_;
  std::thread dispatcher_;
  std::mutex life_mu_;  // open vs close
  std::mutex send_mu_;
  std::atomic<bool> bound_{false};
  std::atomic<bool> connected_{false};
  std::atomic<bool> peer_seen_{false};  // the peer took or sent a message
  std::atomic<bool> stop_{false};
  std::atomic<bool> lost_{false};
  std::atomic<bool> closed_{false};
};

} // namespace peerlink
