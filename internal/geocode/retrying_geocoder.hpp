#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "internal/geocode/geocoder.hpp"

namespace meshdispatch::geocode {

/*
  Retries transient failures of another geocoder with exponential
  backoff (base, 2*base, 4*base ...). NotFound is final.
*/
class RetryingGeocoder final : public Geocoder {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RetryingGeocoder(std::shared_ptr<Geocoder> inner, std::uint32_t attempts, std::chrono::milliseconds base_delay, Sleeper sleep = {});

  GeocodeResult Resolve(const std::string& address) override;

 private:
  std::shared_ptr<Geocoder> inner_;
  std::uint32_t             attempts_;
  std::chrono::milliseconds base_delay_;
  Sleeper                   sleep_;
};

} // namespace meshdispatch::geocode
