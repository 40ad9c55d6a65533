// GeometricRouteBuilder lays out circle, square, figure-eight and meander loops
// on a flat-earth grid around the start point.

#include "core/GeometricRouteBuilder.hpp"
#include "core/GeoUtils.hpp"
#include "core/RouteIdGenerator.hpp"
#include <array>
#include <cmath>
#include <utility>

namespace {
constexpr double kPi = GeoUtils::kPi;
}

Route GeometricRouteBuilder::finish(std::string name,
                                    std::vector<RoutePoint> points,
                                    double distance_m, Difficulty difficulty,
                                    Terrain terrain) {
  Route r;
  r.id = make_route_id();
  r.name = std::move(name);
  r.points = std::move(points);
  r.estimated_distance_m = distance_m;
  r.estimated_steps = EstimateSteps(distance_m, kStepsPerMeter);
  r.estimated_duration_s = distance_m / kWalkingSpeedMps;
  r.difficulty = difficulty;
  r.terrain = terrain;
  return r;
}

std::mt19937_64 GeometricRouteBuilder::makeRng() const {
  if (meander_seed_)
    return std::mt19937_64(*meander_seed_);
  std::random_device rd;
  return std::mt19937_64((static_cast<uint64_t>(rd()) << 32) | rd());
}

// ---------------------------------------------------------------- circle

Route GeometricRouteBuilder::circle(const Coordinate &center,
                                    double target_m) const {
  const double radius = target_m / (2 * kPi);
  const int n = kCirclePoints;

  std::vector<RoutePoint> points;
  points.reserve(n + 1);
  for (int i = 0; i < n; ++i) {
    const double angle = i * 2.0 * kPi / n;
    RoutePoint p{GeoUtils::offsetMeters(center, radius * std::cos(angle),
                                        radius * std::sin(angle)),
                 std::nullopt};
    if (i == 0)
      p.instruction = "Start walking clockwise";
    else if (i == n / 4)
      p.instruction = "Continue straight";
    else if (i == n / 2)
      p.instruction = "You're halfway!";
    else if (i == 3 * n / 4)
      p.instruction = "Almost back to start";
    points.push_back(std::move(p));
  }
  points.push_back(points.front());

  return finish("Perfect Circle", std::move(points), 2 * kPi * radius,
                Difficulty::Easy, Terrain::Urban);
}

// ---------------------------------------------------------------- square

Route GeometricRouteBuilder::square(const Coordinate &center,
                                    double target_m) const {
  const double side = target_m / 4;
  const double half = side / 2;

  // NW, NE, SE, SW: walked clockwise from the north-west corner
  const std::array<Coordinate, 4> corners = {
      GeoUtils::offsetMeters(center, +half, -half),
      GeoUtils::offsetMeters(center, +half, +half),
      GeoUtils::offsetMeters(center, -half, +half),
      GeoUtils::offsetMeters(center, -half, -half)};
  static const std::array<const char *, 4> kTurns = {
      "Head north", "Turn right", "Turn right again", "Final turn"};

  std::vector<RoutePoint> points;
  points.reserve(2 * corners.size());
  for (std::size_t i = 0; i < corners.size(); ++i) {
    points.push_back({corners[i], std::string(kTurns[i])});
    if (i + 1 < corners.size())
      points.push_back(
          {GeoUtils::midpoint(corners[i], corners[i + 1]), std::nullopt});
  }
  points.push_back(points.front());

  return finish("City Block Loop", std::move(points), side * 4,
                Difficulty::Easy, Terrain::Urban);
}

// ---------------------------------------------------------- figure eight

Route GeometricRouteBuilder::figureEight(const Coordinate &center,
                                         double target_m) const {
  const double radius = target_m / (4 * kPi);
  const int n = kFigureEightPoints;
  const Coordinate west = GeoUtils::offsetMeters(center, 0.0, -radius);
  const Coordinate east = GeoUtils::offsetMeters(center, 0.0, +radius);

  std::vector<RoutePoint> points;
  points.reserve(n + 1);
  for (int i = 0; i < n; ++i) {
    const double angle = i * 2.0 * kPi / n;
    const Coordinate &loop_center = (i < n / 2) ? west : east;
    RoutePoint p{GeoUtils::offsetMeters(loop_center,
                                        radius * std::cos(angle),
                                        radius * std::sin(angle)),
                 std::nullopt};
    if (i == 0)
      p.instruction = "Start first loop";
    else if (i == n / 2)
      p.instruction = "Cross to second loop";
    points.push_back(std::move(p));
  }
  points.push_back(points.front());

  return finish("Figure Eight", std::move(points), 4 * kPi * radius,
                Difficulty::Moderate, Terrain::Mixed);
}

// --------------------------------------------------------------- meander

// Random walk of kMeanderSegments legs turning roughly 60 degrees each time.
// The last leg is a forced jump back to the center, and the reported distance
// is the target rather than the sampled polyline length.
Route GeometricRouteBuilder::meander(const Coordinate &center, double target_m,
                                     std::mt19937_64 &rng) const {
  const int n = kMeanderSegments;
  const double base_radius = target_m / (n * kPi);
  std::uniform_real_distribution<double> turn_jitter(-kPi / 6, kPi / 6);
  std::uniform_real_distribution<double> length_jitter(0.0, 0.4);

  std::vector<RoutePoint> points;
  points.reserve(n + 1);
  points.push_back({center, std::string("Begin scenic walk")});

  Coordinate current = center;
  double heading = 0.0;
  for (int i = 1; i < n; ++i) {
    heading += kPi / 3 + turn_jitter(rng);
    const double length = base_radius * (0.8 + length_jitter(rng));
    current = GeoUtils::offsetMeters(current, length * std::cos(heading),
                                     length * std::sin(heading));

    RoutePoint p{current, std::nullopt};
    if (i == n / 3)
      p.instruction = "Enjoy the scenery";
    else if (i == 2 * n / 3)
      p.instruction = "Heading back";
    points.push_back(std::move(p));
  }
  points.push_back({center, std::string("You're back!")});

  return finish("Scenic Meander", std::move(points), target_m,
                Difficulty::Moderate, Terrain::Park);
}

// ------------------------------------------------------------- variants

std::vector<RouteTask> GeometricRouteBuilder::plan(const Coordinate &center,
                                                   double target_m) const {
  // Copies only: a task must not reach back into the builder.
  const GeometricRouteBuilder self = *this;
  std::vector<RouteTask> tasks;
  tasks.emplace_back([self, center, target_m]() -> std::optional<Route> {
    return self.circle(center, target_m);
  });
  tasks.emplace_back([self, center, target_m]() -> std::optional<Route> {
    return self.square(center, target_m);
  });
  tasks.emplace_back([self, center, target_m]() -> std::optional<Route> {
    return self.figureEight(center, target_m);
  });
  tasks.emplace_back([self, center, target_m,
                      rng = makeRng()]() mutable -> std::optional<Route> {
    return self.meander(center, target_m, rng);
  });
  return tasks;
}

std::vector<Route> GeometricRouteBuilder::build(const Coordinate &center,
                                                double target_m) const {
  std::vector<Route> routes;
  for (auto &task : plan(center, target_m)) {
    if (auto r = task())
      routes.push_back(std::move(*r));
  }
  return routes;
}
