#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace meshdispatch::runtime {

/*
  Runs a callback on its own thread at a fixed interval.

  The first run happens after initial_delay. An exception from the
  callback is logged and the loop keeps going. Stop() wakes the thread
  immediately.
*/
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn,
               std::chrono::milliseconds initial_delay = std::chrono::milliseconds::zero());
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

private:
  void Loop();
  bool WaitFor(std::chrono::milliseconds delay);

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds initial_delay_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace meshdispatch::runtime
