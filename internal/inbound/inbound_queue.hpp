#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace meshdispatch::inbound {

/*
  Bounded FIFO between the transport reader and the frame consumer.

  Push never blocks: when the queue is full the oldest unprocessed frame
  is dropped. The radio link cannot be back-pressured.
*/
class InboundQueue {
 public:
  explicit InboundQueue(std::size_t capacity);

  void Push(std::string frame);

  // blocking wait; nullopt once shut down and drained
  std::optional<std::string> Dequeue();

  void Shutdown();

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }
  std::uint64_t Dropped() const;

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::uint64_t           dropped_  = 0;
  bool                    shutdown_ = false;
};

} // namespace meshdispatch::inbound
