#include "retry_scheduler.hpp"

namespace meshdispatch::reliable {

void RetryScheduler::Arm(const std::string& msg_id, util::TimePoint deadline) {
  std::lock_guard lock(mutex_);
  armed_[msg_id] = deadline;
  heap_.push({deadline, msg_id});
}

void RetryScheduler::Cancel(const std::string& msg_id) {
  std::lock_guard lock(mutex_);
  armed_.erase(msg_id);
}

void RetryScheduler::DiscardStaleLocked() const {
  while (!heap_.empty()) {
    const auto& top = heap_.top();
    auto        it  = armed_.find(top.msg_id);
    if (it != armed_.end() && it->second == top.deadline) return;
    heap_.pop();
  }
}

std::vector<std::string> RetryScheduler::PopDue(util::TimePoint now) {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> due;

  DiscardStaleLocked();
  while (!heap_.empty() && heap_.top().deadline <= now) {
    due.push_back(heap_.top().msg_id);
    armed_.erase(heap_.top().msg_id);
    heap_.pop();
    DiscardStaleLocked();
  }
  return due;
}

std::optional<util::TimePoint> RetryScheduler::NextDeadline() const {
  std::lock_guard lock(mutex_);
  DiscardStaleLocked();
  if (heap_.empty()) return std::nullopt;
  return heap_.top().deadline;
}

std::size_t RetryScheduler::Size() const {
  std::lock_guard lock(mutex_);
  return armed_.size();
}

bool RetryScheduler::Contains(const std::string& msg_id) const {
  std::lock_guard lock(mutex_);
  return armed_.contains(msg_id);
}

} // namespace meshdispatch::reliable
