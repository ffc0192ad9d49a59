#include "geo.hpp"

#include <cmath>

namespace meshdispatch::util {

namespace {

constexpr double kEarthRadiusMeters = 6371000.0;
constexpr double kPi                = 3.14159265358979323846;

double Radians(double degrees) {
  return degrees * kPi / 180.0;
}

} // namespace

double DistanceMeters(const LatLon& a, const LatLon& b) {
  const double phi1    = Radians(a.lat);
  const double phi2    = Radians(b.lat);
  const double d_phi   = Radians(b.lat - a.lat);
  const double d_lambda = Radians(b.lon - a.lon);

  const double h = std::sin(d_phi / 2) * std::sin(d_phi / 2) + std::cos(phi1) * std::cos(phi2) * std::sin(d_lambda / 2) * std::sin(d_lambda / 2);
  return 2 * kEarthRadiusMeters * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

} // namespace meshdispatch::util
