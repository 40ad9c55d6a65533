#include "core/GoalDistanceResolver.hpp"

double GoalDistanceResolver::resolve(const Goal &goal) const noexcept {
  switch (goal.kind) {
  case GoalKind::Steps:
    return goal.value * stride_m_;
  case GoalKind::Distance:
    return goal.value * 1000.0; // km
  case GoalKind::Time:
    return goal.value * 60.0 * walking_speed_mps_; // minutes
  }
  return 0.0;
}
