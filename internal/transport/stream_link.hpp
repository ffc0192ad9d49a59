#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>

#include "internal/transport/line_framer.hpp"
#include "internal/transport/transport.hpp"

namespace meshdispatch::transport {

/*
  Shared reader loop for byte-stream radio links (TCP bridge, serial).

  The reader thread owns the connection: it opens it, polls for input,
  feeds the LineFramer and hands each complete frame to the subscriber.
  On any read error or EOF the descriptor is closed and reopened after
  the reconnect interval. Frames already handed off are never lost; only
  the partial line in flight is dropped.

  Descriptors are non-blocking. A Send waits at most write_timeout for
  the link to drain; a frame cut off mid-line poisons the stream, so the
  reader thread drops that connection and reconnects.
*/
class StreamLink : public Transport {
 public:
  StreamLink(std::string name, std::chrono::milliseconds reconnect_interval, std::chrono::milliseconds write_timeout,
             std::size_t max_frame_bytes);
  ~StreamLink() override;

  SendResult Send(const std::string& frame) override;
  void       Subscribe(FrameHandler handler) override;
  void       Start() override;
  void       Stop() override;

  bool Connected() const {
    return fd_.load() >= 0;
  }

 protected:
  // Opens the underlying descriptor. Throws util::TransportError.
  virtual int OpenLink() = 0;

  virtual ssize_t WriteSome(int fd, const char* data, std::size_t size);

  const std::string& Name() const {
    return name_;
  }

 private:
  void       Run();
  bool       TryConnect();
  void       Disconnect(const char* reason);
  void       WaitForReconnect();
  SendResult FailWrite(std::size_t written, const char* error);

  const std::string               name_;
  const std::chrono::milliseconds reconnect_interval_;
  const std::chrono::milliseconds write_timeout_;

  LineFramer   framer_;
  FrameHandler handler_;

  std::atomic<int>  fd_{-1};
  std::mutex        write_mutex_;
  std::atomic<bool> torn_{false};
  std::atomic<bool> running_{false};
  std::thread       thread_;

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace meshdispatch::transport
