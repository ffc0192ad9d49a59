#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "inbound_queue.hpp"

namespace meshdispatch::inbound {

using FrameHandler = std::function<void(const std::string&)>;

/*
  Single consumer of the inbound queue.

  Frames are handed to the handler one at a time, in arrival order. A
  handler failure is logged and the loop moves on to the next frame.
*/
class InboundWorker {
 public:
  InboundWorker(std::shared_ptr<InboundQueue> queue, FrameHandler handler);
  ~InboundWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<InboundQueue> queue_;
  FrameHandler                  handler_;

  std::thread thread_;
};

} // namespace meshdispatch::inbound
