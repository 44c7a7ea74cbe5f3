#pragma once
#include "establisher.hpp"
#include "observer.hpp"
#include "options.hpp"
#include "peerlink.hpp"
#include "stream_reader.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace peerlink {

// Callbacks a binding delivers into. Invoked from the binding's own threads.
class TransportEvents {
public:
  virtual ~TransportEvents() = default;

  virtual void on_connected() = 0;
  virtual void on_message(Message&& msg) = 0;
  virtual void on_lost(const std::string& reason) = 0;
};

class ITransport {
public:
  virtual ~ITransport() = default;

  // Binds the local endpoint (throws TransportError on failure) and starts
  // establishing the channel in the background.
  virtual void open(const Endpoint& ep, TransportEvents& events) = 0;

  // Writes one message; concurrent calls never interleave. Throws TransportError.
  virtual void send(const Message& msg) = 0;

  virtual bool is_connected() const = 0;

  // Stops background work and releases every handle. Idempotent.
  virtual void close() noexcept = 0;
};

// Length-prefixed frames over one TCP connection, won by either side.
class TcpTransport final : public ITransport {
public:
  TcpTransport(const ConnectorOptions& opts, Observer& obs);
  ~TcpTransport() override;

  void open(const Endpoint& ep, TransportEvents& events) override;
  void send(const Message& msg) override;
  bool is_connected() const override;
  void close() noexcept override;

private:
  void on_established(int fd, Establisher::Origin origin);
  void mark_lost(const std::string& reason);

  const ConnectorOptions opts_;
  Observer& obs_;
  TransportEvents* events_{nullptr};
  SocketSlot slot_;
  std::unique_ptr<Establisher> establisher_;
  std::unique_ptr<StreamReader> reader_;
  std::mutex life_mu_;  // open vs close
  std::mutex write_mu_;
  std::atomic<bool> lost_{false};
  std::atomic<bool> closed_{false};
};

std::unique_ptr<ITransport> make_transport(TransportKind kind,
                                           const ConnectorOptions& opts,
                                           Observer& obs);

} // namespace peerlink
