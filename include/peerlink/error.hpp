#pragma once
#include <stdexcept>
#include <string>

namespace peerlink {

// Base of every connector failure.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// No connection was reached within the bounded wait.
class NotConnectedError : public Error {
public:
  explicit NotConnectedError(const std::string& what) : Error(what) {}
};

// bind/listen failure, or a read/write failure on an established handle.
class TransportError : public Error {
public:
  explicit TransportError(const std::string& what) : Error(what) {}
};

// The connection was up and has died; the connector must be recreated.
class ConnectionLostError : public TransportError {
public:
  explicit ConnectionLostError(const std::string& what) : TransportError(what) {}
};

// A frame that cannot be trusted (length above the cap, bad part count).
class FramingError : public Error {
public:
  explicit FramingError(const std::string& what) : Error(what) {}
};

class ClosedError : public Error {
public:
  explicit ClosedError(const std::string& what) : Error(what) {}
};

} // namespace peerlink
