#pragma once
#include "core/GoalDistanceResolver.hpp"
#include "core/RouteBuilder.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <memory>
#include <vector>

class DirectionsService;

// RouteGenerator turns (start, goal) into a list of candidate routes.
//
// Every variant of every registered builder is launched as its own task; the
// result keeps builder registration order and, within a builder, the order of
// its plan(). Failed or empty variants are dropped. Never throws.
class RouteGenerator {
public:
  explicit RouteGenerator(GenerationParams params = GenerationParams{});

  // Builders listed in `params`: geometric first, then street-snapped (which
  // needs `dirs`; without it the street strategy is skipped with a warning).
  static RouteGenerator fromParams(const GenerationParams &params,
                                   std::shared_ptr<DirectionsService> dirs);

  void addBuilder(std::shared_ptr<const RouteBuilder> builder);

  std::vector<Route> generateRoutes(const Coordinate &start,
                                    const Goal &goal) const;

  double targetDistance(const Goal &goal) const {
    return resolver_.resolve(goal);
  }
  // True when the goal resolves to a finite target no longer than
  // params().max_target_m.
  bool acceptsGoal(const Goal &goal) const;
  const GenerationParams &params() const noexcept { return P; }
  std::size_t builderCount() const noexcept { return builders_.size(); }

private:
  GenerationParams P;
  GoalDistanceResolver resolver_;
  std::vector<std::shared_ptr<const RouteBuilder>> builders_;
};
