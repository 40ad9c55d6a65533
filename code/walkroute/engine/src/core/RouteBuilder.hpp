#pragma once
#include "models/CoreTypes.hpp"
#include <functional>
#include <optional>
#include <vector>

// One route variant as an independent unit of work. A task owns everything it
// touches (copies of its inputs, its own RNG) so siblings can run in any
// order or in parallel.
using RouteTask = std::function<std::optional<Route>()>;

// A generation strategy. plan() returns one task per variant, in the order
// the variants should appear in the result list.
class RouteBuilder {
public:
  virtual ~RouteBuilder() = default;
  virtual std::vector<RouteTask> plan(const Coordinate &start,
                                      double target_m) const = 0;
};
