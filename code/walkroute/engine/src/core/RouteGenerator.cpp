// RouteGenerator fans route variants out across builders and collects the
// survivors in declaration order.

#include "core/RouteGenerator.hpp"
#include "core/DirectionsService.hpp"
#include "core/GeoUtils.hpp"
#include "core/GeometricRouteBuilder.hpp"
#include "core/StreetSnappedRouteBuilder.hpp"
#include "core/TaskFanOut.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

RouteGenerator::RouteGenerator(GenerationParams params)
    : P(std::move(params)), resolver_(P.stride_m, P.walking_speed_mps) {}

RouteGenerator
RouteGenerator::fromParams(const GenerationParams &params,
                           std::shared_ptr<DirectionsService> dirs) {
  RouteGenerator gen(params);
  if (params.use_geometric)
    gen.addBuilder(
        std::make_shared<GeometricRouteBuilder>(params.meander_seed));
  if (params.use_street) {
    if (dirs)
      gen.addBuilder(std::make_shared<StreetSnappedRouteBuilder>(
          std::move(dirs), params.parallel));
    else
      std::cerr << "[RouteGenerator] street strategy requested but no "
                   "directions service configured, skipping\n";
  }
  return gen;
}

void RouteGenerator::addBuilder(std::shared_ptr<const RouteBuilder> builder) {
  if (builder)
    builders_.push_back(std::move(builder));
}

bool RouteGenerator::acceptsGoal(const Goal &goal) const {
  const double target_m = resolver_.resolve(goal);
  return std::isfinite(target_m) && target_m <= P.max_target_m;
}

std::vector<Route> RouteGenerator::generateRoutes(const Coordinate &start,
                                                  const Goal &goal) const {
  const double target_m = resolver_.resolve(goal);
  if (!GeoUtils::isUsableStart(start)) {
    std::cerr << "[RouteGenerator] start (" << start.lat << ", " << start.lon
              << ") is outside the usable range, nothing generated\n";
    return {};
  }
  if (!acceptsGoal(goal)) {
    std::cerr << "[RouteGenerator] target " << target_m << " m exceeds "
              << P.max_target_m << " m, nothing generated\n";
    return {};
  }
  const auto t0 = std::chrono::steady_clock::now();

  // 1) Collect every variant of every builder, in order
  std::vector<RouteTask> tasks;
  for (const auto &b : builders_) {
    try {
      for (auto &t : b->plan(start, target_m))
        tasks.push_back(std::move(t));
    } catch (const std::exception &e) {
      std::cerr << "[RouteGenerator] builder plan failed: " << e.what()
                << "\n";
    } catch (...) {
      std::cerr << "[RouteGenerator] builder plan failed: unknown\n";
    }
  }

  // 2) Run them all; slots come back positionally
  auto slots = run_route_tasks(std::move(tasks), P.parallel, "RouteGenerator");

  // 3) Drop empty / failed slots, keep order
  std::vector<Route> routes;
  routes.reserve(slots.size());
  for (auto &s : slots) {
    if (s && !s->points.empty())
      routes.push_back(std::move(*s));
  }

  if (P.verbose) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    std::cout << "[DEBUG] [RouteGenerator] target=" << target_m << " m, "
              << routes.size() << "/" << slots.size() << " variants in " << ms
              << " ms\n";
    for (const auto &r : routes) {
      std::cout << "[DEBUG]   " << r.name << ": reported "
                << r.estimated_distance_m << " m, polyline "
                << GeoUtils::pathLengthMeters(r.points) << " m, "
                << r.points.size() << " points\n";
    }
  }
  return routes;
}
