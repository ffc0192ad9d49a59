#include "stream_link.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::transport {

namespace {
constexpr int         kPollTimeoutMs = 200;
constexpr std::size_t kReadChunk     = 512;
} // namespace

StreamLink::StreamLink(std::string name, std::chrono::milliseconds reconnect_interval, std::chrono::milliseconds write_timeout,
                       std::size_t max_frame_bytes)
    : name_(std::move(name)), reconnect_interval_(reconnect_interval), write_timeout_(write_timeout), framer_(max_frame_bytes) {
}

StreamLink::~StreamLink() {
  Stop();
}

void StreamLink::Subscribe(FrameHandler handler) {
  handler_ = std::move(handler);
}

void StreamLink::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&StreamLink::Run, this);
}

void StreamLink::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(write_mutex_);
  const int fd = fd_.exchange(-1);
  if (fd >= 0) ::close(fd);
}

ssize_t StreamLink::WriteSome(int fd, const char* data, std::size_t size) {
  return ::write(fd, data, size);
}

SendResult StreamLink::Send(const std::string& frame) {
  std::string line = frame;
  line.push_back('\n');

  std::lock_guard lock(write_mutex_);
  const int fd = fd_.load();
  if (fd < 0 || torn_.load()) return SendResult::kDisconnected;

  const auto  deadline = std::chrono::steady_clock::now() + write_timeout_;
  std::size_t written  = 0;
  while (written < line.size()) {
    const ssize_t n = WriteSome(fd, line.data() + written, line.size() - written);
    if (n > 0) {
      written += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;

    const int err = n < 0 ? errno : 0;
    if (err != EAGAIN && err != EWOULDBLOCK) {
      return FailWrite(written, err != 0 ? std::strerror(err) : "no progress");
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) return FailWrite(written, "write timed out");

    pollfd    pfd{fd, POLLOUT, 0};
    const int pr = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (pr < 0 && errno != EINTR) return FailWrite(written, std::strerror(errno));
  }
  return SendResult::kSent;
}

SendResult StreamLink::FailWrite(std::size_t written, const char* error) {
  if (written > 0) torn_ = true;
  MESHDISPATCH_LOG_WARN("radio write failed", {observability::StringField("link", name_), observability::StringField("error", error),
                                               observability::IntField("bytes_written", static_cast<std::int64_t>(written))});
  return SendResult::kFailed;
}

bool StreamLink::TryConnect() {
  try {
    const int fd = OpenLink();
    framer_.Reset();
    {
      std::lock_guard lock(write_mutex_);
      fd_   = fd;
      torn_ = false;
    }
    MESHDISPATCH_LOG_INFO("radio link connected", {observability::StringField("link", name_)});
    return true;
  } catch (const util::TransportError& e) {
    MESHDISPATCH_LOG_WARN("radio link connect failed",
                          {observability::StringField("link", name_), observability::StringField("error", e.what())});
    return false;
  }
}

void StreamLink::Disconnect(const char* reason) {
  {
    std::lock_guard lock(write_mutex_);
    const int fd = fd_.exchange(-1);
    if (fd >= 0) ::close(fd);
  }
  MESHDISPATCH_LOG_WARN("radio link lost", {observability::StringField("link", name_), observability::StringField("reason", reason)});
}

void StreamLink::WaitForReconnect() {
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait_for(lock, reconnect_interval_, [&] { return !running_.load(); });
}

void StreamLink::Run() {
  char buffer[kReadChunk];

  while (running_) {
    if (fd_.load() < 0 && !TryConnect()) {
      WaitForReconnect();
      continue;
    }

    if (torn_.load()) {
      Disconnect("partial frame written");
      WaitForReconnect();
      continue;
    }

    pollfd pfd{fd_.load(), POLLIN, 0};
    const int pr = ::poll(&pfd, 1, kPollTimeoutMs);
    if (pr == 0) continue;
    if (pr < 0) {
      if (errno == EINTR) continue;
      Disconnect(std::strerror(errno));
      WaitForReconnect();
      continue;
    }

    if (pfd.revents & (POLLERR | POLLNVAL)) {
      Disconnect("poll error");
      WaitForReconnect();
      continue;
    }

    const ssize_t n = ::read(pfd.fd, buffer, sizeof(buffer));
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
    if (n <= 0) {
      Disconnect(n == 0 ? "end of stream" : std::strerror(errno));
      WaitForReconnect();
      continue;
    }

    for (auto& frame : framer_.Feed(buffer, static_cast<std::size_t>(n))) {
      if (handler_) handler_(std::move(frame));
    }
  }
}

} // namespace meshdispatch::transport
