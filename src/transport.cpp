#include "peerlink/transport.hpp"
#include "peerlink/zmq_transport.hpp"

#include <stdexcept>

namespace peerlink {

std::unique_ptr<ITransport> make_transport(TransportKind kind,
                                           const ConnectorOptions& opts,
                                           Observer& obs) {
  switch (kind) {
    case TransportKind::Tcp: return std::make_unique<TcpTransport>(opts, obs);
    case TransportKind::ZmqPair: return std::make_unique<ZmqPairTransport>(opts, obs);
  }
  throw std::invalid_argument("unknown transport kind");
}

} // namespace peerlink
