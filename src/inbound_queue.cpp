#include "peerlink/inbound_queue.hpp"

namespace peerlink {

void InboundQueue::push(Message&& msg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    items_.push_back(std::move(msg));
  }
  cv_.notify_one();
}

bool InboundQueue::pop(Message& out) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return !items_.empty() || closed_; });
  if (items_.empty()) return false;
  out = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool InboundQueue::try_pop(Message& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (items_.empty()) return false;
  out = std::move(items_.front());
  items_.pop_front();
  return true;
}

void InboundQueue::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool InboundQueue::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t InboundQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return items_.size();
}

} // namespace peerlink
