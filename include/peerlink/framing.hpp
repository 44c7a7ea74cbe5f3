#pragma once
#include "peerlink.hpp"
#include <cstddef>
#include <cstdint>

namespace peerlink {

// Stream framing: [u32_le tag_len][tag][u32_le payload_len][payload]
static constexpr std::uint32_t kMaxFrameSize = 16 * 1024 * 1024;
static constexpr std::uint32_t kMaxTagSize = 4096;
static constexpr std::size_t kFrameOverhead = 8;

Bytes encode_frame(const Message& msg);

struct DecodeResult {
  bool complete{false};
  Message message;
  std::size_t consumed{0};
};

// Parses one frame from the front of [data, data + n). Returns complete == false
// while the frame is still short; consumed is zero in that case. Throws
// FramingError as soon as a length prefix exceeds its cap.
DecodeResult decode_frame(const std::uint8_t* data, std::size_t n,
                          std::size_t max_payload = kMaxFrameSize);

// Reassembly buffer for a byte stream.
class FrameAssembler {
public:
  explicit FrameAssembler(std::size_t max_payload = kMaxFrameSize);

  void feed(const std::uint8_t* data, std::size_t n);

  // Pops the next complete frame. Throws FramingError on a corrupt prefix.
  bool next(Message& out);

  std::size_t buffered() const { return buf_.size() - off_; }

private:
  std::size_t max_payload_;
  Bytes buf_;
  std::size_t off_{0};
};

// Paired-channel framing: first part is the tag, second the payload.
Message message_from_parts(const void* tag, std::size_t tag_len,
                           const void* payload, std::size_t payload_len,
                           std::size_t max_payload = kMaxFrameSize);

} // namespace peerlink
