#include "static_geocoder.hpp"

#include <cctype>
#include <cstdlib>

namespace meshdispatch::geocode {

namespace {

std::optional<util::LatLon> ParseLiteral(const std::string& address) {
  const auto comma = address.find(',');
  if (comma == std::string::npos) return std::nullopt;

  const std::string lat_text = address.substr(0, comma);
  const std::string lon_text = address.substr(comma + 1);

  char*        end = nullptr;
  const double lat = std::strtod(lat_text.c_str(), &end);
  if (end == lat_text.c_str()) return std::nullopt;
  while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
  if (*end != '\0') return std::nullopt;

  const double lon = std::strtod(lon_text.c_str(), &end);
  if (end == lon_text.c_str()) return std::nullopt;
  while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
  if (*end != '\0') return std::nullopt;

  if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) return std::nullopt;
  return util::LatLon{lat, lon};
}

} // namespace

StaticGeocoder::StaticGeocoder(const meshdispatch::runtime::config::GeocoderConfig& config) {
  for (const auto& entry : config.gazetteer()) {
    Add(entry.address(), {entry.lat(), entry.lon()});
  }
}

void StaticGeocoder::Add(const std::string& address, util::LatLon at) {
  entries_[Normalize(address)] = at;
}

std::string StaticGeocoder::Normalize(const std::string& address) {
  std::string out;
  out.reserve(address.size());
  bool pending_space = false;
  for (char c : address) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

GeocodeResult StaticGeocoder::Resolve(const std::string& address) {
  if (auto literal = ParseLiteral(address)) {
    return GeocodeResult::Found(*literal);
  }

  auto it = entries_.find(Normalize(address));
  if (it == entries_.end()) {
    return GeocodeResult::NotFound("address not in gazetteer");
  }
  return GeocodeResult::Found(it->second);
}

} // namespace meshdispatch::geocode
