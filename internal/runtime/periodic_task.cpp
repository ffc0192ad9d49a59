#include "periodic_task.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace meshdispatch::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn, std::chrono::milliseconds initial_delay)
    : name_(std::move(name)), interval_(interval), initial_delay_(initial_delay), fn_(std::move(fn)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

// false once stopped
bool PeriodicTask::WaitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, delay, [&] { return !running_.load(); });
  return running_.load();
}

void PeriodicTask::Loop() {
  if (initial_delay_.count() > 0 && !WaitFor(initial_delay_)) return;

  while (running_) {
    try {
      fn_();
    } catch (const std::exception& e) {
      MESHDISPATCH_LOG_ERROR("periodic task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }

    if (!WaitFor(interval_)) break;
  }
}

} // namespace meshdispatch::runtime
