#pragma once
#include "framing.hpp"
#include "observer.hpp"
#include "options.hpp"
#include "peerlink.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace peerlink {

// Background loop turning the bytes of one connected socket into messages.
class StreamReader {
public:
  using MessageHandler = std::function<void(Message&&)>;
  using ExitHandler = std::function<void(const std::string& reason)>;

  StreamReader(int fd, const ConnectorOptions& opts, Observer& obs,
               MessageHandler on_message, ExitHandler on_exit);
  ~StreamReader();
  StreamReader(const StreamReader&) = delete;
  StreamReader& operator=(const StreamReader&) = delete;

  void start();

  // Joins the loop. on_exit is not called for a requested stop.
  void stop() noexcept;

private:
  void run();

  int fd_;
  const ConnectorOptions& opts_;
  Observer& obs_;
  MessageHandler on_message_;
  ExitHandler on_exit_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
};

} // namespace peerlink
