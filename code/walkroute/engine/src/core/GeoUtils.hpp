#pragma once
#include "models/CoreTypes.hpp"
#include <cmath>
#include <vector>

// Flat-earth and great-circle helpers shared by the route builders.
class GeoUtils {
public:
  // metres per degree of latitude used by every builder
  static constexpr double kMetersPerDegree = 111000.0;
  static constexpr double kPi = 3.14159265358979323846;
  // flat-earth offsets degrade towards the poles; starts beyond this are
  // refused
  static constexpr double kMaxStartLatitude = 85.0;

  static double degToRad(double deg) { return deg * kPi / 180.0; }

  // Folds any longitude into [-180, 180]; values already inside are
  // returned unchanged.
  static double wrapLongitude(double lon);

  // Equirectangular offset: move `north_m`/`east_m` metres from `origin`.
  // Longitude scale is taken at origin's latitude; fine below ~20 km. The
  // result's longitude is wrapped across the antimeridian.
  static Coordinate offsetMeters(const Coordinate &origin, double north_m,
                                 double east_m);

  // Same as offsetMeters but the radial distance is already in degrees of
  // latitude (the street waypoint generators work that way).
  static Coordinate offsetDegrees(const Coordinate &origin, double radius_deg,
                                  double angle_rad);

  static Coordinate midpoint(const Coordinate &a, const Coordinate &b);

  // Valid and no closer to a pole than kMaxStartLatitude.
  static bool isUsableStart(const Coordinate &c) {
    return c.isValid() && std::fabs(c.lat) <= kMaxStartLatitude;
  }

  // haversine formulas
  static double haversine(const Coordinate &p1, const Coordinate &p2);
  static double pathLengthMeters(const std::vector<RoutePoint> &pts);

  struct BBox {
    double min_lat, min_lon, max_lat, max_lon;
  };
  static BBox computeBBox(const std::vector<RoutePoint> &pts);
};
