#pragma once

namespace meshdispatch::util {

struct LatLon {
  double lat = 0.0;
  double lon = 0.0;
};

// Great-circle distance in meters (haversine, mean Earth radius).
double DistanceMeters(const LatLon& a, const LatLon& b);

} // namespace meshdispatch::util
