#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace meshdispatch::reliable {

/*
  Min-heap of (deadline, msg_id).

  Re-arming a message replaces its deadline; the superseded heap entry is
  skipped when it surfaces. Thread-safe.
*/
class RetryScheduler {
 public:
  void Arm(const std::string& msg_id, util::TimePoint deadline);
  void Cancel(const std::string& msg_id);

  // Removes and returns every message whose deadline is <= now, earliest first.
  std::vector<std::string> PopDue(util::TimePoint now);

  std::optional<util::TimePoint> NextDeadline() const;
  std::size_t                    Size() const;
  bool                           Contains(const std::string& msg_id) const;

 private:
  struct Entry {
    util::TimePoint deadline;
    std::string     msg_id;

    bool operator>(const Entry& other) const {
      return deadline > other.deadline;
    }
  };

  void DiscardStaleLocked() const;

  mutable std::mutex                                                    mutex_;
  mutable std::priority_queue<Entry, std::vector<Entry>, std::greater<>> heap_;
  std::unordered_map<std::string, util::TimePoint>                      armed_;
};

} // namespace meshdispatch::reliable
