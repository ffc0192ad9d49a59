#pragma once

#include <chrono>
#include <cstdint>

#include "config/config.pb.h"

namespace meshdispatch::reliable {

/*
  When to retransmit an unacknowledged frame.

  attempts counts transmissions already made, the first send included.
  A message is given up once attempts == max_attempts and the last
  deadline has passed, so at most max_attempts frames go on air.
*/
struct RetryPolicy {
  enum class Backoff {
    kFixed,
    kExponential,
  };

  Backoff                   backoff      = Backoff::kFixed;
  std::chrono::milliseconds base         = std::chrono::seconds(45);
  double                    multiplier   = 2.0;
  std::chrono::milliseconds cap          = std::chrono::minutes(10);
  std::uint32_t             max_attempts = 5;

  // Wait after the attempts-th transmission.
  std::chrono::milliseconds DelayAfter(std::uint32_t attempts) const;

  bool Exhausted(std::uint32_t attempts) const {
    return attempts >= max_attempts;
  }

  static RetryPolicy FromConfig(const meshdispatch::runtime::config::ReliabilityConfig& config);
};

} // namespace meshdispatch::reliable
