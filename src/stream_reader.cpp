#include "peerlink/stream_reader.hpp"
#include "peerlink/error.hpp"
#include "peerlink/socket.hpp"

#include <spdlog/fmt/fmt.h>

#include <sys/socket.h>
#include <poll.h>

#include <cerrno>

namespace peerlink {

StreamReader::StreamReader(int fd, const ConnectorOptions& opts, Observer& obs,
                           MessageHandler on_message, ExitHandler on_exit)
  : fd_(fd), opts_(opts), obs_(obs),
    on_message_(std::move(on_message)), on_exit_(std::move(on_exit)) {}

StreamReader::~StreamReader() { stop(); }

void StreamReader::start() {
  thread_ = std::thread([this] { run(); });
}

void StreamReader::stop() noexcept {
  stop_ = true;
  if (thread_.joinable()) thread_.join();
}

void StreamReader::run() {
  FrameAssembler assembler(opts_.max_frame_size);
  Bytes chunk(opts_.read_chunk);
  std::string reason;

  while (!stop_) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, (int)opts_.poll_interval.count());
    if (ret == 0) continue;
    if (ret < 0) {
      if (errno == EINTR) continue;
      reason = "poll failed: " + errno_string(errno);
      break;
    }

    ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      reason = "read failed: " + errno_string(errno);
      break;
    }
    if (n == 0) {
      reason = "peer closed the connection";
      break;
    }

    assembler.feed(chunk.data(), (std::size_t)n);
    try {
      Message msg;
      while (assembler.next(msg)) {
        obs_.log(spdlog::level::debug,
                 fmt::format("received '{}', {} payload bytes", msg.tag, msg.payload.size()));
        on_message_(std::move(msg));
      }
    } catch (const FramingError& e) {
      reason = std::string("framing error: ") + e.what();
      break;
    }
  }

  if (stop_) return;
  obs_.log(spdlog::level::err, "stream reader stopped: " + reason);
  if (on_exit_) on_exit_(reason);
}

} // namespace peerlink
