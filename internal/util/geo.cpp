#include "geo.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace routebroker::util {

double ToRadians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

double ToDegrees(double radians) {
  return radians * 180.0 / std::numbers::pi;
}

double HaversineNm(const GeoPoint& a, const GeoPoint& b) {
  const double phi1    = ToRadians(a.lat);
  const double phi2    = ToRadians(b.lat);
  const double d_phi   = ToRadians(b.lat - a.lat);
  const double d_lambda = ToRadians(b.lon - a.lon);

  const double h = std::sin(d_phi / 2) * std::sin(d_phi / 2) +
                   std::cos(phi1) * std::cos(phi2) * std::sin(d_lambda / 2) * std::sin(d_lambda / 2);
  const double c = 2 * std::asin(std::sqrt(std::min(1.0, h)));

  return kEarthRadiusKm * c / kKmPerNauticalMile;
}

bool IsValidCoordinate(const GeoPoint& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon) && p.lat >= -90.0 && p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}

} // namespace routebroker::util
