#include "peerlink/framing.hpp"
#include "peerlink/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstring>

namespace peerlink {

static void write_u32_le(std::uint8_t* out, std::uint32_t v) {
  out[0] = (v) & 0xFF;
  out[1] = (v >> 8) & 0xFF;
  out[2] = (v >> 16) & 0xFF;
  out[3] = (v >> 24) & 0xFF;
}
static std::uint32_t read_u32_le(const std::uint8_t* in) {
  return ((std::uint32_t)in[0]) |
         ((std::uint32_t)in[1] << 8) |
         ((std::uint32_t)in[2] << 16) |
         ((std::uint32_t)in[3] << 24);
}

static void check_tag_len(std::size_t n) {
  if (n > kMaxTagSize)
    throw FramingError(fmt::format("tag length {} exceeds limit {}", n, kMaxTagSize));
}
static void check_payload_len(std::size_t n, std::size_t max_payload) {
  if (n > max_payload)
    throw FramingError(fmt::format("payload length {} exceeds limit {}", n, max_payload));
}

Bytes encode_frame(const Message& msg) {
  check_tag_len(msg.tag.size());
  check_payload_len(msg.payload.size(), kMaxFrameSize);

  Bytes out(kFrameOverhead + msg.tag.size() + msg.payload.size());
  std::uint8_t* p = out.data();
  write_u32_le(p, (std::uint32_t)msg.tag.size());
  p += 4;
  if (!msg.tag.empty()) std::memcpy(p, msg.tag.data(), msg.tag.size());
  p += msg.tag.size();
  write_u32_le(p, (std::uint32_t)msg.payload.size());
  p += 4;
  if (!msg.payload.empty()) std::memcpy(p, msg.payload.data(), msg.payload.size());
  return out;
}

DecodeResult decode_frame(const std::uint8_t* data, std::size_t n, std::size_t max_payload) {
  DecodeResult r;
  if (n < 4) return r;
  const std::size_t tag_len = read_u32_le(data);
  check_tag_len(tag_len);

  if (n < 4 + tag_len + 4) return r;
  const std::size_t payload_len = read_u32_le(data + 4 + tag_len);
  check_payload_len(payload_len, max_payload);

  const std::size_t total = kFrameOverhead + tag_len + payload_len;
  if (n < total) return r;

  const std::uint8_t* tag = data + 4;
  const std::uint8_t* payload = tag + tag_len + 4;
  r.message.tag.assign((const char*)tag, tag_len);
  r.message.payload.assign(payload, payload + payload_len);
  r.consumed = total;
  r.complete = true;
  return r;
}

FrameAssembler::FrameAssembler(std::size_t max_payload) : max_payload_(max_payload) {}

void FrameAssembler::feed(const std::uint8_t* data, std::size_t n) {
  if (n == 0) return;
  // compact once the consumed prefix dominates the buffer
  if (off_ > 0 && off_ >= buf_.size() / 2) {
    buf_.erase(buf_.begin(), buf_.begin() + (std::ptrdiff_t)off_);
    off_ = 0;
  }
  buf_.insert(buf_.end(), data, data + n);
}

bool FrameAssembler::next(Message& out) {
  DecodeResult r = decode_frame(buf_.data() + off_, buf_.size() - off_, max_payload_);
  if (!r.complete) return false;
  off_ += r.consumed;
  if (off_ == buf_.size()) {
    buf_.clear();
    off_ = 0;
  }
  out = std::move(r.message);
  return true;
}

Message message_from_parts(const void* tag, std::size_t tag_len,
                           const void* payload, std::size_t payload_len,
                           std::size_t max_payload) {
  check_tag_len(tag_len);
  check_payload_len(payload_len, max_payload);
  Message m;
  m.tag.assign((const char*)tag, tag_len);
  const std::uint8_t* p = (const std::uint8_t*)payload;
  if (payload_len) m.payload.assign(p, p + payload_len);
  return m;
}

} // namespace peerlink
