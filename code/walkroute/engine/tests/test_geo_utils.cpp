#include "core/GeoUtils.hpp"
#include "core/GeometricRouteBuilder.hpp"
#include "core/RouteGenerator.hpp"
#include "core/StreetSnappedRouteBuilder.hpp"

#include <gtest/gtest.h>

namespace {
void expect_all_in_range(const Route &r) {
  for (std::size_t i = 0; i < r.points.size(); ++i) {
    EXPECT_TRUE(r.points[i].coord.isValid())
        << r.name << " point " << i << " lon=" << r.points[i].coord.lon;
  }
}
} // namespace

TEST(GeoUtils, WrapLongitudeLeavesValidValuesAlone) {
  EXPECT_EQ(GeoUtils::wrapLongitude(-0.1055), -0.1055);
  EXPECT_EQ(GeoUtils::wrapLongitude(180.0), 180.0);
  EXPECT_EQ(GeoUtils::wrapLongitude(-180.0), -180.0);
  EXPECT_NEAR(GeoUtils::wrapLongitude(180.5), -179.5, 1e-12);
  EXPECT_NEAR(GeoUtils::wrapLongitude(-181.0), 179.0, 1e-12);
  EXPECT_NEAR(GeoUtils::wrapLongitude(540.25), -179.75, 1e-12);
}

TEST(GeoUtils, OffsetsWrapAcrossAntimeridian) {
  const Coordinate near_dateline{0.0, 179.999};
  const Coordinate east = GeoUtils::offsetMeters(near_dateline, 0.0, 500.0);
  EXPECT_TRUE(east.isValid());
  EXPECT_LT(east.lon, -179.99);

  const Coordinate west =
      GeoUtils::offsetDegrees(Coordinate{0.0, -179.999}, 0.01, -GeoUtils::kPi / 2);
  EXPECT_TRUE(west.isValid());
  EXPECT_GT(west.lon, 179.99);
}

TEST(GeoUtils, MidpointTakesShortWayAcrossAntimeridian) {
  const Coordinate m =
      GeoUtils::midpoint(Coordinate{10.0, 179.0}, Coordinate{12.0, -179.5});
  EXPECT_DOUBLE_EQ(m.lat, 11.0);
  EXPECT_NEAR(m.lon, 179.75, 1e-12);

  const Coordinate plain =
      GeoUtils::midpoint(Coordinate{0.0, -1.0}, Coordinate{0.0, 3.0});
  EXPECT_DOUBLE_EQ(plain.lon, 1.0);
}

TEST(GeoUtils, HaversineAcrossAntimeridianIsShort) {
  const double d =
      GeoUtils::haversine(Coordinate{0.0, 179.999}, Coordinate{0.0, -179.999});
  EXPECT_NEAR(d, 222.4, 0.5);
}

TEST(GeoUtils, UsableStartExcludesPolarCaps) {
  EXPECT_TRUE(GeoUtils::isUsableStart({51.628, -0.1055}));
  EXPECT_TRUE(GeoUtils::isUsableStart({-85.0, 0.0}));
  EXPECT_FALSE(GeoUtils::isUsableStart({85.01, 0.0}));
  EXPECT_FALSE(GeoUtils::isUsableStart({-90.0, 0.0}));
  EXPECT_FALSE(GeoUtils::isUsableStart({0.0, 181.0}));
}

TEST(GeoUtils, GeometricRoutesNearAntimeridianStayInRange) {
  GeometricRouteBuilder b(17);
  for (const auto &r : b.build(Coordinate{0.0, 179.999}, 3000.0))
    expect_all_in_range(r);
  for (const auto &r : b.build(Coordinate{-16.5, -179.995}, 5000.0))
    expect_all_in_range(r);
}

TEST(GeoUtils, StreetWaypointsNearAntimeridianStayInRange) {
  const Coordinate start{0.0, 179.999};
  for (const auto &c :
       StreetSnappedRouteBuilder::loopWaypoints(start, 3000.0, true))
    EXPECT_TRUE(c.isValid()) << c.lon;
  for (const auto &c :
       StreetSnappedRouteBuilder::outAndBackDestinations(start, 1500.0))
    EXPECT_TRUE(c.isValid()) << c.lon;
  for (const auto &c :
       StreetSnappedRouteBuilder::explorationWaypoints(start, 3000.0))
    EXPECT_TRUE(c.isValid()) << c.lon;
}

TEST(GeoUtils, HighestUsableLatitudeGivesValidRoutes) {
  GenerationParams p;
  p.meander_seed = 4;
  p.max_target_m = 100000.0;
  auto gen = RouteGenerator::fromParams(p, nullptr);
  auto routes = gen.generateRoutes({85.0, 10.0}, {GoalKind::Distance, 100.0});
  ASSERT_EQ(routes.size(), 4u);
  for (const auto &r : routes)
    expect_all_in_range(r);
}

TEST(GeoUtils, GeneratorRefusesPolarStart) {
  auto gen = RouteGenerator::fromParams(GenerationParams{}, nullptr);
  EXPECT_TRUE(gen.generateRoutes({90.0, 0.0}, {GoalKind::Distance, 3.0}).empty());
  EXPECT_TRUE(
      gen.generateRoutes({-89.5, 120.0}, {GoalKind::Distance, 3.0}).empty());
}
