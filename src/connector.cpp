#include "peerlink/connector.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace peerlink {

static std::uint16_t checked_port(int port, const char* what) {
  if (port < 1 || port > 65535)
    throw std::invalid_argument(fmt::format("{} {} out of range 1..65535", what, port));
  return (std::uint16_t)port;
}

Connector::Connector(TransportKind kind, ConnectorOptions opts, std::shared_ptr<Observer> obs)
  : kind_(kind),
    opts_(std::move(opts)),
    obs_(obs ? std::move(obs) : std::make_shared<LogObserver>()) {
  opts_.validate();
}

Connector::~Connector() { close(); }

void Connector::connect(int listen_port, int target_port, const std::string& target_host) {
  Endpoint ep;
  ep.listen_port = checked_port(listen_port, "listening port");
  ep.peer_port = checked_port(target_port, "target port");
  if (target_host.empty()) throw std::invalid_argument("target host is empty");
  ep.peer_host = target_host;

  std::shared_ptr<ITransport> t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const ConnectionState s = state_.load();
    if (s == ConnectionState::Closed) throw ClosedError("connect on a closed connector");
    if (s != ConnectionState::Idle)
      throw std::logic_error(fmt::format("connect while {}", to_string(s)));
    transport_ = make_transport(kind_, opts_, *obs_);
    t = transport_;
    state_ = ConnectionState::Establishing;
    since_connect_.reset();
  }

  obs_->log(spdlog::level::info,
            fmt::format("{} connector: listening on {}, peer {}:{}", to_string(kind_),
                        ep.listen_port, ep.peer_host, ep.peer_port));
  try {
    t->open(ep, *this);
  } catch (...) {
    // bind/listen failures are reported to the caller; the session is over
    close();
    throw;
  }
}

void Connector::on_connected() {
  double ms = 0.0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ConnectionState expected = ConnectionState::Establishing;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Connected)) return;
    ms = std::chrono::duration<double, std::milli>(since_connect_.elapsed()).count();
  }
  cv_.notify_all();
  obs_->timing("establish", ms);
  obs_->log(spdlog::level::info, fmt::format("{} connector connected", to_string(kind_)));
}

void Connector::on_message(Message&& msg) {
  inbox_.push(std::move(msg));
}

void Connector::on_lost(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == ConnectionState::Closed || lost_) return;
    lost_reason_ = reason;
    lost_ = true;
  }
  inbox_.close();
  cv_.notify_all();
  obs_->connection_lost(reason);
}

std::shared_ptr<ITransport> Connector::wait_usable(const char* op) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, opts_.connect_wait, [this] {
    const ConnectionState s = state_.load();
    return s == ConnectionState::Connected || s == ConnectionState::Closed || lost_;
  });
  if (state_ == ConnectionState::Closed)
    throw ClosedError(fmt::format("{} on a closed connector", op));
  if (lost_) throw ConnectionLostError(fmt::format("{}: connection lost: {}", op, lost_reason_));
  if (state_ != ConnectionState::Connected)
    throw NotConnectedError(fmt::format("{}: not connected to peer after {} ms", op,
                                        opts_.connect_wait.count()));
  return transport_;
}

void Connector::send(const std::string& tag, const Bytes& payload) {
  if (tag.empty()) throw std::invalid_argument("message tag is empty");
  std::shared_ptr<ITransport> t = wait_usable("send");

  Message msg{tag, payload};
  {
    ScopedTiming timing(*obs_, "send");
    t->send(msg);
  }
  obs_->log(spdlog::level::debug,
            fmt::format("sent '{}', {} payload bytes", tag, payload.size()));
}

Message Connector::receive() {
  Message msg;
  // drain what arrived before a loss, then report it
  if (lost_ && inbox_.try_pop(msg)) return msg;
  wait_usable("receive");
  if (inbox_.pop(msg)) return msg;

  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == ConnectionState::Closed) throw ClosedError("receive: connector closed");
  throw ConnectionLostError("receive: connection lost: " + lost_reason_);
}

void Connector::close() noexcept {
  std::shared_ptr<ITransport> t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.exchange(ConnectionState::Closed) == ConnectionState::Closed) return;
    t = std::move(transport_);
  }
  inbox_.close();
  cv_.notify_all();
  if (!t) return;

  t->close();
  obs_->log(spdlog::level::info, fmt::format("{} connector closed", to_string(kind_)));
  // give the OS time to release the ports before they are bound again
  if (opts_.close_drain.count() > 0) std::this_thread::sleep_for(opts_.close_drain);
}

bool Connector::is_connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_ == ConnectionState::Connected && !lost_ && transport_ && transport_->is_connected();
}

} // namespace peerlink
