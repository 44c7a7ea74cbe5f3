#include "peerlink/options.hpp"

#include <stdexcept>

namespace peerlink {

static long long parse_number(const std::string& key, const std::string& value) {
  std::size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(value, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("--" + key + ": not a number: " + value);
  }
  if (used != value.size()) throw std::invalid_argument("--" + key + ": not a number: " + value);
  return v;
}

void ConnectorOptions::validate() const {
  auto positive = [](std::chrono::milliseconds d, const char* name) {
    if (d.count() <= 0) throw std::invalid_argument(std::string(name) + " must be positive");
  };
  positive(dial_timeout, "dial_timeout");
  positive(retry_backoff, "retry_backoff");
  positive(poll_interval, "poll_interval");
  positive(connect_wait, "connect_wait");
  if (close_drain.count() < 0) throw std::invalid_argument("close_drain must not be negative");
  if (max_frame_size == 0 || max_frame_size > kMaxFrameSize)
    throw std::invalid_argument("max_frame_size out of range");
  if (read_chunk == 0) throw std::invalid_argument("read_chunk must be positive");
}

bool parse_option(ConnectorOptions& opts, const std::string& key, const std::string& value) {
  if (key == "bind-host") { opts.bind_host = value; return true; }

  std::chrono::milliseconds* ms = nullptr;
  if (key == "dial-timeout-ms") ms = &opts.dial_timeout;
  else if (key == "retry-backoff-ms") ms = &opts.retry_backoff;
  else if (key == "poll-interval-ms") ms = &opts.poll_interval;
  else if (key == "connect-wait-ms") ms = &opts.connect_wait;
  else if (key == "close-drain-ms") ms = &opts.close_drain;

  if (ms) {
    *ms = std::chrono::milliseconds(parse_number(key, value));
    return true;
  }
  if (key == "max-frame-size") {
    long long v = parse_number(key, value);
    if (v <= 0) throw std::invalid_argument("--max-frame-size must be positive");
    opts.max_frame_size = (std::size_t)v;
    return true;
  }
  return false;
}

} // namespace peerlink
