#pragma once
#include "core/RouteBuilder.hpp"
#include "models/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

// Idealized closed loops computed purely from a center point and a target
// length. No external calls; only the meander draws random numbers.
class GeometricRouteBuilder : public RouteBuilder {
public:
  static constexpr double kStepsPerMeter = 1.25;
  static constexpr double kWalkingSpeedMps = 1.4;
  static constexpr int kCirclePoints = 20;
  static constexpr int kFigureEightPoints = 16;
  static constexpr int kMeanderSegments = 12;

  // With a seed every meander is reproducible; without one each call seeds
  // from std::random_device.
  explicit GeometricRouteBuilder(
      std::optional<uint64_t> meander_seed = std::nullopt)
      : meander_seed_(meander_seed) {}

  // Circle, square, figure-eight, meander; in that order.
  std::vector<Route> build(const Coordinate &center, double target_m) const;
  std::vector<RouteTask> plan(const Coordinate &center,
                              double target_m) const override;

  Route circle(const Coordinate &center, double target_m) const;
  Route square(const Coordinate &center, double target_m) const;
  Route figureEight(const Coordinate &center, double target_m) const;
  Route meander(const Coordinate &center, double target_m,
                std::mt19937_64 &rng) const;

private:
  std::optional<uint64_t> meander_seed_;

  std::mt19937_64 makeRng() const;
  static Route finish(std::string name, std::vector<RoutePoint> points,
                      double distance_m, Difficulty difficulty,
                      Terrain terrain);
};
