#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <vector>

// Walking path between two coordinates as reported by a routing backend.
struct WalkingDirections {
  std::vector<Coordinate> points; // polyline, from -> to
  double distance_m = 0.0;
  double travel_time_s = 0.0;
};

// Point-to-point street routing. Implementations must tolerate concurrent
// calls from sibling route variants; nullopt means no route was found.
class DirectionsService {
public:
  virtual ~DirectionsService() = default;
  virtual std::optional<WalkingDirections>
  walkingDirections(const Coordinate &from, const Coordinate &to) = 0;
};
