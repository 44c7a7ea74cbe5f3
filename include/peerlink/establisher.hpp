#pragma once
#include "observer.hpp"
#include "options.hpp"
#include "peerlink.hpp"
#include "socket.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace peerlink {

// Single-assignment slot for the connected socket. The first try_install wins;
// every later one fails and the caller keeps (and drops) its socket.
class SocketSlot {
public:
  SocketSlot() = default;
  ~SocketSlot() { reset(); }
  SocketSlot(const SocketSlot&) = delete;
  SocketSlot& operator=(const SocketSlot&) = delete;

  bool try_install(Socket& s) noexcept;

  bool installed() const noexcept { return fd_.load() >= 0; }
  bool retired() const noexcept { return fd_.load() == kRetired; }
  int fd() const noexcept { return fd_.load(); }

  // shutdown(2) both directions; unblocks a reader or writer on the socket.
  void shutdown() noexcept;

  // Closes the installed socket, if any, and retires the slot.
  void reset() noexcept;

private:
  static constexpr int kEmpty = -1;
  static constexpr int kRetired = -2;
  std::atomic<int> fd_{kEmpty};
};

// Races an accept loop against a dial loop; the winner lands in the slot.
class Establisher {
public:
  enum class Origin { Inbound, Outbound };
  using WonHandler = std::function<void(int fd, Origin origin)>;

  Establisher(const ConnectorOptions& opts, Observer& obs, SocketSlot& slot);
  ~Establisher();
  Establisher(const Establisher&) = delete;
  Establisher& operator=(const Establisher&) = delete;

  // Binds the listener in the calling thread (throws TransportError), then
  // starts both loops. on_won runs on the winning loop's thread.
  void start(const Endpoint& ep, WonHandler on_won);

  // Stops and joins both loops.
  void stop() noexcept;

private:
  void accept_loop();
  void dial_loop();
  void settle(Socket s, Origin origin);
  bool sleep_unless_stopped(std::chrono::milliseconds d);

  const ConnectorOptions& opts_;
  Observer& obs_;
  SocketSlot& slot_;
  Endpoint ep_;
  WonHandler on_won_;
  Socket listener_;
  std::thread accept_thread_;
  std::thread dial_thread_;
  std::atomic<bool> stop_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

const char* to_string(Establisher::Origin o);

} // namespace peerlink
