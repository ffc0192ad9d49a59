#include "inbound_queue.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace meshdispatch::inbound {

InboundQueue::InboundQueue(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("inbound queue capacity must be positive");
  }
}

void InboundQueue::Push(std::string frame) {
  bool          dropped = false;
  std::uint64_t total   = 0;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;

    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      dropped = true;
      total   = ++dropped_;
    }
    queue_.push_back(std::move(frame));
  }
  cv_.notify_one();

  if (dropped) {
    observability::Metrics::Instance().RecordInboundDropped();
    MESHDISPATCH_LOG_WARN("inbound queue full, dropped oldest frame",
                          {observability::IntField("capacity", static_cast<std::int64_t>(capacity_)),
                           observability::IntField("dropped_total", static_cast<std::int64_t>(total))});
  }
}

std::optional<std::string> InboundQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  std::string frame = std::move(queue_.front());
  queue_.pop_front();
  return frame;
}

void InboundQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t InboundQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::uint64_t InboundQueue::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace meshdispatch::inbound
