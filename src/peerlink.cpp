#include "peerlink/peerlink.hpp"
#include <stdexcept>

namespace peerlink {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Idle: return "idle";
    case ConnectionState::Establishing: return "establishing";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Closed: return "closed";
  }
  return "unknown";
}

const char* to_string(TransportKind k) {
  switch (k) {
    case TransportKind::Tcp: return "tcp";
    case TransportKind::ZmqPair: return "zmq";
  }
  return "unknown";
}

TransportKind parse_transport_kind(const std::string& name) {
  if (name == "tcp") return TransportKind::Tcp;
  if (name == "zmq") return TransportKind::ZmqPair;
  throw std::invalid_argument("unknown transport: " + name);
}

} // namespace peerlink
