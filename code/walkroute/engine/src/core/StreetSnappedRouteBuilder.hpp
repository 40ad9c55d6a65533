#pragma once
#include "core/DirectionsService.hpp"
#include "core/RouteBuilder.hpp"
#include "models/CoreTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Loops that follow real streets: a handful of waypoints is laid out
// geometrically, then every waypoint-to-waypoint edge is routed through the
// DirectionsService and the returned polylines are concatenated.
//
// A failed edge is skipped, not fatal; a variant with nothing routed yields
// nullopt.
class StreetSnappedRouteBuilder : public RouteBuilder {
public:
  static constexpr double kStepsPerMeter = 1.3;
  static constexpr int kLoopWaypoints = 6;

  explicit StreetSnappedRouteBuilder(std::shared_ptr<DirectionsService> dirs,
                                     bool parallel = true)
      : dirs_(std::move(dirs)), parallel_(parallel) {}

  // Neighborhood Loop, Counter Loop, Out & Back, Discovery Route. Variants
  // run concurrently; each one walks its edges sequentially.
  std::vector<std::optional<Route>> build(const Coordinate &start,
                                          double target_m) const;
  std::vector<RouteTask> plan(const Coordinate &start,
                              double target_m) const override;

  std::optional<Route> loop(const Coordinate &start, double target_m,
                            bool clockwise) const;
  std::optional<Route> outAndBack(const Coordinate &start,
                                  double target_m) const;
  std::optional<Route> exploration(const Coordinate &start,
                                   double target_m) const;

  // Waypoint layouts, exposed for inspection.
  static std::vector<Coordinate> loopWaypoints(const Coordinate &center,
                                               double target_m,
                                               bool clockwise);
  static std::vector<Coordinate> outAndBackDestinations(const Coordinate &start,
                                                        double half_m);
  static std::vector<Coordinate> explorationWaypoints(const Coordinate &start,
                                                      double target_m);

private:
  struct Labels {
    const char *start;
    const char *next;
    const char *finish;
  };

  std::shared_ptr<DirectionsService> dirs_;
  bool parallel_;

  std::optional<WalkingDirections> fetch(const Coordinate &from,
                                         const Coordinate &to) const;
  std::optional<Route> stitchCircular(const std::vector<Coordinate> &waypoints,
                                      const Labels &labels, std::string name,
                                      Difficulty difficulty,
                                      Terrain terrain) const;
  static Route finish(std::string name, std::vector<RoutePoint> points,
                      double distance_m, double duration_s,
                      Difficulty difficulty, Terrain terrain);
};
