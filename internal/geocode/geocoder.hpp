#pragma once

#include <optional>
#include <string>

#include "internal/util/geo.hpp"

namespace meshdispatch::geocode {

enum class GeocodeStatus {
  kOk,
  kNotFound,    // the address does not resolve; retrying will not help
  kUnavailable, // transient backend failure
};

struct GeocodeResult {
  GeocodeStatus               status = GeocodeStatus::kNotFound;
  std::optional<util::LatLon> coordinates;
  std::string                 message;

  bool Ok() const {
    return status == GeocodeStatus::kOk && coordinates.has_value();
  }

  static GeocodeResult Found(util::LatLon at) {
    return {GeocodeStatus::kOk, at, {}};
  }
  static GeocodeResult NotFound(std::string why) {
    return {GeocodeStatus::kNotFound, std::nullopt, std::move(why)};
  }
  static GeocodeResult Unavailable(std::string why) {
    return {GeocodeStatus::kUnavailable, std::nullopt, std::move(why)};
  }
};

// Address -> coordinates. Implementations must be thread-safe.
class Geocoder {
 public:
  virtual ~Geocoder() = default;

  virtual GeocodeResult Resolve(const std::string& address) = 0;
};

} // namespace meshdispatch::geocode
