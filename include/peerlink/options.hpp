#pragma once
#include "framing.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace peerlink {

struct ConnectorOptions {
  std::chrono::milliseconds dial_timeout{500};
  std::chrono::milliseconds retry_backoff{200};
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds connect_wait{2000};
  std::chrono::milliseconds close_drain{250};
  std::size_t max_frame_size{kMaxFrameSize};
  std::size_t read_chunk{64 * 1024};
  std::string bind_host; // empty: all interfaces

  // Throws std::invalid_argument
  void validate() const;
};

// Applies one command-line "--key value" pair (key given without the dashes).
// Returns false for an unknown key.
bool parse_option(ConnectorOptions& opts, const std::string& key, const std::string& value);

} // namespace peerlink
