#pragma once
#include "peerlink.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace peerlink {

// Unbounded FIFO between the reader thread and receive() callers.
class InboundQueue {
public:
  void push(Message&& msg);

  // Blocks until a message is available or the queue is closed. Messages queued
  // before close() are still handed out; returns false once closed and empty.
  bool pop(Message& out);

  bool try_pop(Message& out);

  // Wakes every blocked pop(). Further pushes are dropped.
  void close();

  bool closed() const;
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Message> items_;
  bool closed_{false};
};

} // namespace peerlink
