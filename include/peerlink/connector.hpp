#pragma once
#include "error.hpp"
#include "observer.hpp"
#include "options.hpp"
#include "peerlink.hpp"
#include "inbound_queue.hpp"
#include "transport.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace peerlink {

// Symmetric full-duplex link to one peer. Both peers run the same code: each
// listens on its own port and dials the other's, and whichever connection
// comes up first carries the session.
class Connector : private TransportEvents {
public:
  explicit Connector(TransportKind kind,
                     ConnectorOptions opts = ConnectorOptions(),
                     std::shared_ptr<Observer> obs = nullptr);
  ~Connector() override;
  Connector(const Connector&) = delete;
  Connector& operator=(const Connector&) = delete;

  // Returns as soon as the listener is bound and background work started.
  // Throws std::invalid_argument for a bad port, TransportError when the
  // listen port cannot be bound, ClosedError after close().
  void connect(int listen_port, int target_port,
               const std::string& target_host = "127.0.0.1");

  // Fire-and-forget. Waits up to connect_wait for the link. Throws
  // NotConnectedError, ConnectionLostError, TransportError, ClosedError.
  void send(const std::string& tag, const Bytes& payload = Bytes());

  // Blocks for the next message in arrival order. Throws NotConnectedError if
  // the link was not reached within connect_wait, ConnectionLostError once the
  // link died and the queue is drained, ClosedError if closed.
  Message receive();

  // Joins every background thread and releases all handles. Idempotent.
  void close() noexcept;

  bool is_connected() const;
  bool connection_lost() const noexcept { return lost_.load(); }
  ConnectionState state() const noexcept { return state_.load(); }

private:
  void on_connected() override;
  void on_message(Message&& msg) override;
  void on_lost(const std::string& reason) override;

  // Waits for Connected/lost/closed up to connect_wait; throws when not usable.
  std::shared_ptr<ITransport> wait_usable(const char* op);

  const TransportKind kind_;
  const ConnectorOptions opts_;
  std::shared_ptr<Observer> obs_;
  InboundQueue inbox_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::shared_ptr<ITransport> transport_;
  std::atomic<ConnectionState> state_{ConnectionState::Idle};
  std::atomic<bool> lost_{false};
  std::string lost_reason_;
  spdlog::stopwatch since_connect_;
};

} // namespace peerlink
