#pragma once

#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/geocode/geocoder.hpp"

namespace meshdispatch::geocode {

/*
  Offline geocoder backed by a configured gazetteer.

  Lookup ignores case and repeated whitespace. An address written as a
  literal "lat, lon" pair resolves to itself.
*/
class StaticGeocoder final : public Geocoder {
 public:
  StaticGeocoder() = default;
  explicit StaticGeocoder(const meshdispatch::runtime::config::GeocoderConfig& config);

  void Add(const std::string& address, util::LatLon at);

  GeocodeResult Resolve(const std::string& address) override;

  static std::string Normalize(const std::string& address);

 private:
  std::unordered_map<std::string, util::LatLon> entries_;
};

} // namespace meshdispatch::geocode
