#pragma once

namespace routebroker::util {

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

// Start and end of a route request.
struct Endpoints {
  GeoPoint start;
  GeoPoint end;
};

/*
  Closed latitude/longitude box: lat_min <= lat <= lat_max and
  lon_min <= lon <= lon_max. Points on an edge are inside.
*/
struct BoundingBox {
  double lat_min = 0.0;
  double lat_max = 0.0;
  double lon_min = 0.0;
  double lon_max = 0.0;

  bool IsOrdered() const {
    return lat_min <= lat_max && lon_min <= lon_max;
  }

  bool Contains(const GeoPoint& p) const {
    return lat_min <= p.lat && p.lat <= lat_max && lon_min <= p.lon && p.lon <= lon_max;
  }

  bool Contains(const Endpoints& e) const {
    return Contains(e.start) && Contains(e.end);
  }

  double Area() const {
    return (lat_max - lat_min) * (lon_max - lon_min);
  }
};

inline constexpr double kEarthRadiusKm      = 6371.0088;
inline constexpr double kKmPerNauticalMile  = 1.852;

double ToRadians(double degrees);
double ToDegrees(double radians);

// Great-circle distance in nautical miles.
double HaversineNm(const GeoPoint& a, const GeoPoint& b);

bool IsValidCoordinate(const GeoPoint& p);

} // namespace routebroker::util
