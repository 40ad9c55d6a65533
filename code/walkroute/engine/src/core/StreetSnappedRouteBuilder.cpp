// StreetSnappedRouteBuilder stitches directions lookups between geometric
// waypoints into walkable loops.

#include "core/StreetSnappedRouteBuilder.hpp"
#include "core/GeoUtils.hpp"
#include "core/RouteIdGenerator.hpp"
#include "core/TaskFanOut.hpp"
#include <array>
#include <cmath>
#include <iostream>
#include <utility>

namespace {
constexpr double kPi = GeoUtils::kPi;
}

Route StreetSnappedRouteBuilder::finish(std::string name,
                                        std::vector<RoutePoint> points,
                                        double distance_m, double duration_s,
                                        Difficulty difficulty,
                                        Terrain terrain) {
  Route r;
  r.id = make_route_id();
  r.name = std::move(name);
  r.points = std::move(points);
  r.estimated_distance_m = distance_m;
  r.estimated_steps = EstimateSteps(distance_m, kStepsPerMeter);
  r.estimated_duration_s = duration_s;
  r.difficulty = difficulty;
  r.terrain = terrain;
  return r;
}

// Exceptions from the backend count as a failed edge.
std::optional<WalkingDirections>
StreetSnappedRouteBuilder::fetch(const Coordinate &from,
                                 const Coordinate &to) const {
  if (!dirs_)
    return std::nullopt;
  try {
    return dirs_->walkingDirections(from, to);
  } catch (const std::exception &e) {
    std::cerr << "[StreetSnapped] directions lookup threw: " << e.what()
              << "\n";
    return std::nullopt;
  } catch (...) {
    std::cerr << "[StreetSnapped] directions lookup threw: unknown\n";
    return std::nullopt;
  }
}

// ------------------------------------------------------------- waypoints

std::vector<Coordinate>
StreetSnappedRouteBuilder::loopWaypoints(const Coordinate &center,
                                         double target_m, bool clockwise) {
  const double radius_deg =
      target_m / (2.0 * kPi) / GeoUtils::kMetersPerDegree;
  std::vector<Coordinate> out;
  out.reserve(kLoopWaypoints);
  for (int i = 0; i < kLoopWaypoints; ++i) {
    const double angle = i * 2.0 * kPi / kLoopWaypoints;
    out.push_back(
        GeoUtils::offsetDegrees(center, radius_deg, clockwise ? angle : -angle));
  }
  return out;
}

// N, E, S, W of start, `half_m` metres away.
std::vector<Coordinate>
StreetSnappedRouteBuilder::outAndBackDestinations(const Coordinate &start,
                                                  double half_m) {
  const double dist_deg = half_m / GeoUtils::kMetersPerDegree;
  const std::array<double, 4> bearings = {0.0, kPi / 2, kPi, 3 * kPi / 2};
  std::vector<Coordinate> out;
  out.reserve(bearings.size());
  for (double b : bearings)
    out.push_back(GeoUtils::offsetDegrees(start, dist_deg, b));
  return out;
}

// Start plus three diagonal points on a smaller circle.
std::vector<Coordinate>
StreetSnappedRouteBuilder::explorationWaypoints(const Coordinate &start,
                                                double target_m) {
  const double radius_deg =
      target_m / (3.0 * kPi) / GeoUtils::kMetersPerDegree;
  const std::array<double, 3> angles = {kPi / 4, 3 * kPi / 4, 5 * kPi / 4};
  std::vector<Coordinate> out{start};
  for (double a : angles)
    out.push_back(GeoUtils::offsetDegrees(start, radius_deg, a));
  return out;
}

// ------------------------------------------------------------- stitching

std::optional<Route> StreetSnappedRouteBuilder::stitchCircular(
    const std::vector<Coordinate> &waypoints, const Labels &labels,
    std::string name, Difficulty difficulty, Terrain terrain) const {
  std::vector<RoutePoint> points;
  double total_distance = 0.0;
  double total_duration = 0.0;

  const std::size_t n = waypoints.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Coordinate &from = waypoints[i];
    const Coordinate &to = waypoints[(i + 1) % n]; // wraps back to the first
    auto edge = fetch(from, to);
    if (!edge) {
      std::cerr << "[StreetSnapped] " << name << ": edge " << i << " -> "
                << (i + 1) % n << " has no route, skipping\n";
      continue;
    }
    for (std::size_t j = 0; j < edge->points.size(); ++j) {
      RoutePoint p{edge->points[j], std::nullopt};
      if (j == 0 && !points.empty())
        p.instruction = labels.next;
      points.push_back(std::move(p));
    }
    total_distance += edge->distance_m;
    total_duration += edge->travel_time_s;
  }

  if (points.size() < 2)
    return std::nullopt;
  points.front().instruction = labels.start;
  points.back().instruction = labels.finish;
  return finish(std::move(name), std::move(points), total_distance,
                total_duration, difficulty, terrain);
}

// --------------------------------------------------------------- variants

std::optional<Route> StreetSnappedRouteBuilder::loop(const Coordinate &start,
                                                     double target_m,
                                                     bool clockwise) const {
  static const Labels kLoop{"Start your walk", "Continue to next waypoint",
                            "You're back at the start!"};
  return stitchCircular(loopWaypoints(start, target_m, clockwise), kLoop,
                        clockwise ? "Neighborhood Loop" : "Counter Loop",
                        Difficulty::Easy, Terrain::Urban);
}

std::optional<Route>
StreetSnappedRouteBuilder::outAndBack(const Coordinate &start,
                                      double target_m) const {
  const auto destinations = outAndBackDestinations(start, target_m / 2.0);
  if (destinations.empty())
    return std::nullopt;
  const Coordinate &dest = destinations.front();

  std::vector<RoutePoint> points;
  double total_distance = 0.0;
  double total_duration = 0.0;

  if (auto out = fetch(start, dest)) {
    const std::size_t count = out->points.size();
    for (std::size_t i = 0; i < count; ++i) {
      RoutePoint p{out->points[i], std::nullopt};
      if (i == 0)
        p.instruction = "Head out on your route";
      else if (i == count - 1)
        p.instruction = "Turnaround point reached";
      points.push_back(std::move(p));
    }
    total_distance += out->distance_m;
    total_duration += out->travel_time_s;
  } else {
    std::cerr << "[StreetSnapped] Out & Back: no route to turnaround\n";
  }

  if (auto back = fetch(dest, start)) {
    const std::size_t count = back->points.size();
    // first point repeats the turnaround
    for (std::size_t i = 1; i < count; ++i) {
      RoutePoint p{back->points[i], std::nullopt};
      if (i == count - 1)
        p.instruction = "You're back where you started!";
      points.push_back(std::move(p));
    }
    total_distance += back->distance_m;
    total_duration += back->travel_time_s;
  } else {
    std::cerr << "[StreetSnapped] Out & Back: no route home\n";
  }

  if (points.size() < 2)
    return std::nullopt;
  return finish("Out & Back", std::move(points), total_distance,
                total_duration, Difficulty::Moderate, Terrain::Mixed);
}

std::optional<Route>
StreetSnappedRouteBuilder::exploration(const Coordinate &start,
                                       double target_m) const {
  static const Labels kExplore{"Start exploring", "Exploring new area",
                               "Back to start!"};
  return stitchCircular(explorationWaypoints(start, target_m), kExplore,
                        "Discovery Route", Difficulty::Moderate,
                        Terrain::Park);
}

std::vector<RouteTask>
StreetSnappedRouteBuilder::plan(const Coordinate &start,
                                double target_m) const {
  const StreetSnappedRouteBuilder self = *this; // shares only dirs_
  return {
      [self, start, target_m] { return self.loop(start, target_m, true); },
      [self, start, target_m] { return self.loop(start, target_m, false); },
      [self, start, target_m] { return self.outAndBack(start, target_m); },
      [self, start, target_m] { return self.exploration(start, target_m); },
  };
}

std::vector<std::optional<Route>>
StreetSnappedRouteBuilder::build(const Coordinate &start,
                                 double target_m) const {
  return run_route_tasks(plan(start, target_m), parallel_, "StreetSnapped");
}
