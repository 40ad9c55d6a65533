#pragma once
#include "models/CoreTypes.hpp"

// Collapses any goal type into the one quantity the builders consume: a
// target path length in metres.
class GoalDistanceResolver {
public:
  static constexpr double kDefaultStrideMeters = 0.8;
  static constexpr double kDefaultWalkingSpeedMps = 1.4;

  explicit GoalDistanceResolver(double stride_m = kDefaultStrideMeters,
                                double walking_speed_mps =
                                    kDefaultWalkingSpeedMps)
      : stride_m_(stride_m), walking_speed_mps_(walking_speed_mps) {}

  double resolve(const Goal &goal) const noexcept;

private:
  double stride_m_;
  double walking_speed_mps_;
};
