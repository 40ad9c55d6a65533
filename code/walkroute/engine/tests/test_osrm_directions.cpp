#include "infra/OsrmDirectionsService.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <httplib.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace {
const char *kOkBody = R"({
  "code": "Ok",
  "routes": [{
    "geometry": {"type": "LineString",
                 "coordinates": [[-0.1055, 51.628], [-0.1049, 51.6291],
                                 [-0.1040, 51.6302]]},
    "legs": [{"summary": "High Street", "weight": 210.4,
              "duration": 210.4, "distance": 291.7}],
    "weight_name": "duration",
    "weight": 210.4, "duration": 210.4, "distance": 291.7
  }],
  "waypoints": [{"name": "High Street", "distance": 3.1,
                 "location": [-0.1055, 51.628]},
                {"name": "", "distance": 0.4,
                 "location": [-0.1040, 51.6302]}]
})";
} // namespace

TEST(OsrmResponse, ParsesRouteLegsAndWaypoints) {
  auto resp = nlohmann::json::parse(kOkBody).get<OsrmResponse>();
  ASSERT_TRUE(resp.ok());
  ASSERT_EQ(resp.routes.size(), 1u);
  const auto &r = resp.routes[0];
  EXPECT_EQ(r.geometry.type, "LineString");
  EXPECT_EQ(r.geometry.coordinates.size(), 3u);
  ASSERT_EQ(r.legs.size(), 1u);
  EXPECT_EQ(r.legs[0].summary, "High Street");
  EXPECT_DOUBLE_EQ(r.distance, 291.7);
  ASSERT_EQ(resp.waypoints.size(), 2u);
  EXPECT_DOUBLE_EQ(resp.waypoints[0].distance, 3.1);
}

TEST(OsrmDirectionsService, ConvertsLonLatPairsToCoordinates) {
  auto resp = nlohmann::json::parse(kOkBody).get<OsrmResponse>();
  auto d = OsrmDirectionsService::toDirections(resp);
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->points.size(), 3u);
  EXPECT_DOUBLE_EQ(d->points[0].lat, 51.628);
  EXPECT_DOUBLE_EQ(d->points[0].lon, -0.1055);
  EXPECT_DOUBLE_EQ(d->points[2].lat, 51.6302);
  EXPECT_DOUBLE_EQ(d->distance_m, 291.7);
  EXPECT_DOUBLE_EQ(d->travel_time_s, 210.4);
}

TEST(OsrmDirectionsService, NoRouteGivesNothing) {
  auto resp = nlohmann::json::parse(
                  R"({"code":"NoRoute","message":"Impossible route"})")
                  .get<OsrmResponse>();
  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(resp.message, "Impossible route");
  EXPECT_FALSE(OsrmDirectionsService::toDirections(resp).has_value());
}

TEST(OsrmDirectionsService, OkWithoutRoutesIsNotOk) {
  auto resp = nlohmann::json::parse(R"({"code":"Ok","routes":[]})")
                  .get<OsrmResponse>();
  EXPECT_FALSE(resp.ok());
  EXPECT_FALSE(OsrmDirectionsService::toDirections(resp).has_value());
}

TEST(OsrmResponse, EncodedPolylineIsRejected) {
  auto j = nlohmann::json::parse(
      R"({"code":"Ok","routes":[{"geometry":"_p~iF~ps|U_ulLnnqC"}]})");
  EXPECT_THROW(j.get<OsrmResponse>(), std::runtime_error);
}

TEST(OsrmDirectionsService, RequestPathIsLonLatWithGeojson) {
  OsrmParams p;
  p.profile = "foot";
  OsrmDirectionsService svc(p);
  EXPECT_EQ(svc.buildRequestPath({51.628, -0.1055}, {51.63, -0.1}),
            "/route/v1/foot/-0.1055000,51.6280000;-0.1000000,51.6300000"
            "?overview=full&geometries=geojson&steps=false");
}

TEST(OsrmDirectionsService, UnreachableDaemonGivesNothing) {
  OsrmParams p;
  p.host = "127.0.0.1";
  p.port = 1; // nothing listens here
  p.timeout_s = 1;
  OsrmDirectionsService svc(p);
  EXPECT_FALSE(svc.walkingDirections({51.628, -0.1055}, {51.63, -0.1})
                   .has_value());
}

namespace {

// Local stand-in for osrm-routed: answers every /route/v1 request with the
// configured status and body and records the last request it saw.
class OsrmStub : public ::testing::Test {
protected:
  void SetUp() override {
    server_.Get(R"(/route/v1/.*)", [this](const httplib::Request &req,
                                          httplib::Response &res) {
      std::lock_guard<std::mutex> lock(mu_);
      last_path_ = req.path;
      last_geometries_ = req.get_param_value("geometries");
      last_overview_ = req.get_param_value("overview");
      res.status = status_;
      res.set_content(body_, "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 200 && !server_.is_running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(server_.is_running());
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable())
      thread_.join();
  }

  void reply(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mu_);
    status_ = status;
    body_ = std::move(body);
  }

  std::string lastPath() {
    std::lock_guard<std::mutex> lock(mu_);
    return last_path_;
  }
  std::string lastParams() {
    std::lock_guard<std::mutex> lock(mu_);
    return "overview=" + last_overview_ + "&geometries=" + last_geometries_;
  }

  OsrmDirectionsService service() const {
    OsrmParams p;
    p.host = "127.0.0.1";
    p.port = port_;
    p.timeout_s = 2;
    return OsrmDirectionsService(p);
  }

  const Coordinate from_{51.628, -0.1055};
  const Coordinate to_{51.6302, -0.1040};

private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = -1;
  std::mutex mu_;
  int status_ = 200;
  std::string body_;
  std::string last_path_;
  std::string last_geometries_;
  std::string last_overview_;
};

} // namespace

TEST_F(OsrmStub, SuccessfulRouteIsConverted) {
  reply(200, kOkBody);
  auto svc = service();
  auto d = svc.walkingDirections(from_, to_);
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->points.size(), 3u);
  EXPECT_DOUBLE_EQ(d->points.front().lat, 51.628);
  EXPECT_DOUBLE_EQ(d->points.back().lon, -0.1040);
  EXPECT_DOUBLE_EQ(d->distance_m, 291.7);
  EXPECT_DOUBLE_EQ(d->travel_time_s, 210.4);
  EXPECT_EQ(lastPath(),
            "/route/v1/foot/-0.1055000,51.6280000;-0.1040000,51.6302000");
  EXPECT_EQ(lastParams(), "overview=full&geometries=geojson");
}

TEST_F(OsrmStub, NoRouteBodyOn400GivesNothing) {
  reply(400, R"({"code":"NoRoute","message":"Impossible route between points"})");
  EXPECT_FALSE(service().walkingDirections(from_, to_).has_value());
}

TEST_F(OsrmStub, ServerErrorStatusGivesNothing) {
  reply(500, kOkBody); // body is ignored for anything but 200/400
  EXPECT_FALSE(service().walkingDirections(from_, to_).has_value());
}

TEST_F(OsrmStub, MalformedBodyGivesNothing) {
  reply(200, R"({"code":"Ok","routes":[{"geometry":)");
  EXPECT_FALSE(service().walkingDirections(from_, to_).has_value());
}

TEST_F(OsrmStub, EncodedPolylineBodyGivesNothing) {
  reply(200, R"({"code":"Ok","routes":[{"geometry":"_p~iF~ps|U"}]})");
  EXPECT_FALSE(service().walkingDirections(from_, to_).has_value());
}
