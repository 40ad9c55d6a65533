#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

double GeoUtils::wrapLongitude(double lon) {
  if (lon >= -180.0 && lon <= 180.0)
    return lon;
  return std::remainder(lon, 360.0);
}

Coordinate GeoUtils::offsetMeters(const Coordinate &origin, double north_m,
                                  double east_m) {
  const double lat_scale = kMetersPerDegree;
  const double lon_scale = kMetersPerDegree * std::cos(degToRad(origin.lat));
  return Coordinate{origin.lat + north_m / lat_scale,
                    wrapLongitude(origin.lon + east_m / lon_scale)};
}

Coordinate GeoUtils::offsetDegrees(const Coordinate &origin, double radius_deg,
                                   double angle_rad) {
  return Coordinate{origin.lat + radius_deg * std::cos(angle_rad),
                    wrapLongitude(origin.lon + radius_deg * std::sin(angle_rad) /
                                                   std::cos(degToRad(origin.lat)))};
}

// Takes the short way round when a and b straddle the antimeridian.
Coordinate GeoUtils::midpoint(const Coordinate &a, const Coordinate &b) {
  double lon = (a.lon + b.lon) / 2;
  if (std::fabs(b.lon - a.lon) > 180.0)
    lon = wrapLongitude(lon + 180.0);
  return Coordinate{(a.lat + b.lat) / 2, lon};
}

double GeoUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  double phi1 = degToRad(p1.lat);
  double phi2 = degToRad(p2.lat);
  double delta_phi = degToRad(p2.lat - p1.lat);
  double delta_gamma = degToRad(p2.lon - p1.lon);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  return 2 * 6371000 * asin(sqrt(h));
}

double GeoUtils::pathLengthMeters(const std::vector<RoutePoint> &pts) {
  double total = 0.0;
  for (std::size_t i = 1; i < pts.size(); ++i)
    total += haversine(pts[i - 1].coord, pts[i].coord);
  return total;
}

GeoUtils::BBox GeoUtils::computeBBox(const std::vector<RoutePoint> &pts) {
  BBox b{+90, +180, -90, -180};
  for (const auto &p : pts) {
    b.min_lat = std::min(b.min_lat, p.coord.lat);
    b.max_lat = std::max(b.max_lat, p.coord.lat);
    b.min_lon = std::min(b.min_lon, p.coord.lon);
    b.max_lon = std::max(b.max_lon, p.coord.lon);
  }
  return b;
}
