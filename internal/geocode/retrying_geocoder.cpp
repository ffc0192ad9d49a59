#include "retrying_geocoder.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace meshdispatch::geocode {

RetryingGeocoder::RetryingGeocoder(std::shared_ptr<Geocoder> inner, std::uint32_t attempts, std::chrono::milliseconds base_delay, Sleeper sleep)
    : inner_(std::move(inner)), attempts_(attempts == 0 ? 1 : attempts), base_delay_(base_delay), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

GeocodeResult RetryingGeocoder::Resolve(const std::string& address) {
  GeocodeResult result;
  for (std::uint32_t attempt = 1; attempt <= attempts_; ++attempt) {
    result = inner_->Resolve(address);
    if (result.status != GeocodeStatus::kUnavailable) {
      return result;
    }

    MESHDISPATCH_LOG_WARN("geocoder unavailable", {observability::StringField("address", address), observability::IntField("attempt", attempt),
                                                   observability::StringField("error", result.message)});
    if (attempt < attempts_) {
      sleep_(base_delay_ * (1LL << (attempt - 1)));
    }
  }
  return result;
}

} // namespace meshdispatch::geocode
