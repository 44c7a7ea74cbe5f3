#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace peerlink {
using Bytes = std::vector<std::uint8_t>;

// One tagged message. An empty payload is how "no payload" travels on the wire.
struct Message {
  std::string tag;
  Bytes payload;
};

enum class ConnectionState { Idle, Establishing, Connected, Closed };

struct Endpoint {
  std::uint16_t listen_port{0};
  std::string peer_host{"127.0.0.1"};
  std::uint16_t peer_port{0};
};

enum class TransportKind { Tcp, ZmqPair };

const char* to_string(ConnectionState s);
const char* to_string(TransportKind k);

// "tcp" or "zmq"; throws std::invalid_argument otherwise
TransportKind parse_transport_kind(const std::string& name);

} // namespace peerlink
