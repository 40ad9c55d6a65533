#include "core/GeometricRouteBuilder.hpp"
#include "core/RouteGenerator.hpp"
#include "core/StreetSnappedRouteBuilder.hpp"
#include "core/TaskFanOut.hpp"
#include "fakes.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {
const Coordinate kStart{51.6280, -0.1055};

std::vector<std::string> names(const std::vector<Route> &routes) {
  std::vector<std::string> out;
  for (const auto &r : routes)
    out.push_back(r.name);
  return out;
}

GenerationParams street_only(bool parallel = true) {
  GenerationParams p;
  p.use_geometric = false;
  p.use_street = true;
  p.parallel = parallel;
  return p;
}
} // namespace

TEST(RouteGenerator, GeometricDefaultsProduceFourRoutes) {
  GenerationParams p;
  p.meander_seed = 11;
  auto gen = RouteGenerator::fromParams(p, nullptr);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 3.0});
  EXPECT_EQ(names(routes),
            (std::vector<std::string>{"Perfect Circle", "City Block Loop",
                                      "Figure Eight", "Scenic Meander"}));
  EXPECT_NEAR(routes[0].estimated_distance_m, 3000.0, 1e-6);
  EXPECT_NEAR(routes[0].estimated_duration_s, 2142.857, 0.01);
}

TEST(RouteGenerator, StepGoalGivesFourKilometreSquare) {
  auto gen = RouteGenerator::fromParams(GenerationParams{}, nullptr);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Steps, 5000});
  ASSERT_EQ(routes.size(), 4u);
  EXPECT_DOUBLE_EQ(routes[1].estimated_distance_m, 4000.0);
  EXPECT_EQ(routes[1].estimated_steps, 5000);
}

TEST(RouteGenerator, OrderIsDeclarationOrderNotCompletionOrder) {
  RouteGenerator gen;
  gen.addBuilder(std::make_shared<DelayedBuilder>(
      std::vector<DelayedBuilder::Variant>{{"first", 120ms},
                                           {"second", 60ms},
                                           {"third", 0ms}}));
  gen.addBuilder(std::make_shared<DelayedBuilder>(
      std::vector<DelayedBuilder::Variant>{{"fourth", 30ms},
                                           {"fifth", 1ms}}));
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 1.0});
  EXPECT_EQ(names(routes), (std::vector<std::string>{
                               "first", "second", "third", "fourth", "fifth"}));
}

TEST(RouteGenerator, FailedVariantsAreDroppedWithoutReordering) {
  RouteGenerator gen;
  gen.addBuilder(std::make_shared<DelayedBuilder>(
      std::vector<DelayedBuilder::Variant>{{"a", 40ms},
                                           {"b", 0ms, /*fails=*/true},
                                           {"c", 10ms},
                                           {"d", 0ms, /*fails=*/true}}));
  auto routes = gen.generateRoutes(kStart, {GoalKind::Time, 10});
  EXPECT_EQ(names(routes), (std::vector<std::string>{"a", "c"}));
  EXPECT_NEAR(routes[0].estimated_distance_m, 840.0, 1e-9);
}

TEST(RouteGenerator, DeferredLaunchRunsSequentiallyInOrder) {
  GenerationParams p;
  p.parallel = false;
  RouteGenerator gen(p);
  gen.addBuilder(std::make_shared<DelayedBuilder>(
      std::vector<DelayedBuilder::Variant>{{"x", 5ms}, {"y", 0ms}}));
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 1.0});
  EXPECT_EQ(names(routes), (std::vector<std::string>{"x", "y"}));
}

TEST(RouteGenerator, AllDirectionsFailingGivesEmptyList) {
  auto dirs = std::make_shared<FakeDirectionsService>();
  dirs->fail_if = [](const Coordinate &, const Coordinate &) { return true; };
  auto gen = RouteGenerator::fromParams(street_only(), dirs);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 2.0});
  EXPECT_TRUE(routes.empty());
  EXPECT_GT(dirs->calls.load(), 0);
}

TEST(RouteGenerator, ThrowingBackendStillYieldsEmptyNotError) {
  auto dirs = std::make_shared<FakeDirectionsService>();
  dirs->throw_if = [](const Coordinate &, const Coordinate &) { return true; };
  auto gen = RouteGenerator::fromParams(street_only(false), dirs);
  std::vector<Route> routes;
  EXPECT_NO_THROW(routes =
                      gen.generateRoutes(kStart, {GoalKind::Steps, 4000}));
  EXPECT_TRUE(routes.empty());
}

TEST(RouteGenerator, BothStrategiesGeometricFirst) {
  auto dirs = std::make_shared<FakeDirectionsService>();
  GenerationParams p;
  p.use_street = true;
  p.meander_seed = 3;
  auto gen = RouteGenerator::fromParams(p, dirs);
  EXPECT_EQ(gen.builderCount(), 2u);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 2.0});
  EXPECT_EQ(names(routes),
            (std::vector<std::string>{
                "Perfect Circle", "City Block Loop", "Figure Eight",
                "Scenic Meander", "Neighborhood Loop", "Counter Loop",
                "Out & Back", "Discovery Route"}));
}

TEST(RouteGenerator, StreetWithoutDirectionsServiceIsSkipped) {
  auto gen = RouteGenerator::fromParams(street_only(), nullptr);
  EXPECT_EQ(gen.builderCount(), 0u);
  EXPECT_TRUE(gen.generateRoutes(kStart, {GoalKind::Distance, 1.0}).empty());
}

TEST(RouteGenerator, SlowEdgeDegradesOnlyItsOwnRoute) {
  auto dirs = std::make_shared<FakeDirectionsService>();
  // the out & back turnaround is unreachable
  const auto turnaround =
      StreetSnappedRouteBuilder::outAndBackDestinations(kStart, 1000.0)[0];
  dirs->fail_if = [turnaround](const Coordinate &from, const Coordinate &to) {
    return from == turnaround || to == turnaround;
  };
  auto gen = RouteGenerator::fromParams(street_only(), dirs);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 2.0});
  EXPECT_EQ(names(routes),
            (std::vector<std::string>{"Neighborhood Loop", "Counter Loop",
                                      "Discovery Route"}));
}

TEST(TaskFanOut, NonStandardThrowLeavesSlotEmpty) {
  for (bool parallel : {true, false}) {
    std::vector<RouteTask> tasks;
    tasks.emplace_back([]() -> std::optional<Route> {
      Route r;
      r.name = "kept";
      return r;
    });
    tasks.emplace_back([]() -> std::optional<Route> { throw 42; });
    tasks.emplace_back([]() -> std::optional<Route> {
      throw std::runtime_error("boom");
    });
    tasks.emplace_back([]() -> std::optional<Route> { return std::nullopt; });

    std::vector<std::optional<Route>> slots;
    ASSERT_NO_THROW(slots = run_route_tasks(std::move(tasks), parallel, "t"));
    ASSERT_EQ(slots.size(), 4u);
    ASSERT_TRUE(slots[0].has_value());
    EXPECT_EQ(slots[0]->name, "kept");
    EXPECT_FALSE(slots[1].has_value());
    EXPECT_FALSE(slots[2].has_value());
    EXPECT_FALSE(slots[3].has_value());
  }
}

TEST(RouteGenerator, NonStandardBackendThrowIsContained) {
  auto dirs = std::make_shared<FakeDirectionsService>();
  dirs->throw_non_standard = true;
  dirs->throw_if = [](const Coordinate &, const Coordinate &) { return true; };
  auto gen = RouteGenerator::fromParams(street_only(), dirs);
  std::vector<Route> routes;
  EXPECT_NO_THROW(routes =
                      gen.generateRoutes(kStart, {GoalKind::Distance, 2.0}));
  EXPECT_TRUE(routes.empty());
}

TEST(RouteGenerator, GoalBeyondLimitGeneratesNothing) {
  GenerationParams p;
  p.max_target_m = 5000.0;
  auto gen = RouteGenerator::fromParams(p, nullptr);
  EXPECT_TRUE(gen.acceptsGoal({GoalKind::Distance, 5.0}));
  EXPECT_FALSE(gen.acceptsGoal({GoalKind::Distance, 5.001}));
  EXPECT_FALSE(gen.acceptsGoal({GoalKind::Steps, 3e9}));
  EXPECT_TRUE(gen.generateRoutes(kStart, {GoalKind::Distance, 6.0}).empty());
  EXPECT_EQ(gen.generateRoutes(kStart, {GoalKind::Distance, 5.0}).size(), 4u);
}

TEST(RouteGenerator, LongestAllowedGoalKeepsStepsNonNegative) {
  auto gen = RouteGenerator::fromParams(GenerationParams{}, nullptr);
  auto routes = gen.generateRoutes(kStart, {GoalKind::Distance, 100.0});
  ASSERT_EQ(routes.size(), 4u);
  for (const auto &r : routes) {
    EXPECT_GE(r.estimated_steps, 0) << r.name;
    EXPECT_EQ(r.estimated_steps,
              static_cast<int>(std::floor(r.estimated_distance_m * 1.25)))
        << r.name;
  }
}
