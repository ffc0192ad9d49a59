#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/time.hpp"

namespace meshdispatch::reliable {

std::chrono::milliseconds RetryPolicy::DelayAfter(std::uint32_t attempts) const {
  if (backoff == Backoff::kFixed || attempts <= 1) {
    return std::min(base, cap);
  }

  const double scaled = static_cast<double>(base.count()) * std::pow(multiplier, static_cast<double>(attempts - 1));
  if (!std::isfinite(scaled) || scaled >= static_cast<double>(cap.count())) {
    return cap;
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(scaled));
}

RetryPolicy RetryPolicy::FromConfig(const meshdispatch::runtime::config::ReliabilityConfig& config) {
  RetryPolicy policy;
  policy.backoff = config.backoff() == meshdispatch::runtime::config::BACKOFF_KIND_EXPONENTIAL ? Backoff::kExponential : Backoff::kFixed;
  policy.base    = util::ToMillis(config.ack_timeout(), policy.base);
  if (config.backoff_multiplier() >= 1.0) {
    policy.multiplier = config.backoff_multiplier();
  }
  policy.cap = util::ToMillis(config.max_backoff(), policy.cap);
  if (config.max_attempts() > 0) {
    policy.max_attempts = config.max_attempts();
  }
  return policy;
}

} // namespace meshdispatch::reliable
