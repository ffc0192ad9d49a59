#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace meshdispatch::transport {

enum class SendResult {
  kSent,
  kDisconnected,
  kFailed,
};

constexpr std::string_view ToString(SendResult result) {
  switch (result) {
    case SendResult::kSent:
      return "sent";
    case SendResult::kDisconnected:
      return "disconnected";
    case SendResult::kFailed:
      return "failed";
  }
  return "unknown";
}

using FrameHandler = std::function<void(std::string frame)>;

/*
  One radio link carrying self-contained frames.

  Send is best-effort: it writes one frame, waiting no longer than the
  link's write timeout, and reports the outcome. It never queues or
  retries. The subscribed handler is called
  on the link's reader thread once per received frame, in arrival order.
  Subscribe must be called before Start.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual SendResult Send(const std::string& frame) = 0;

  virtual void Subscribe(FrameHandler handler) = 0;

  virtual void Start() = 0;
  virtual void Stop()  = 0;
};

} // namespace meshdispatch::transport
