// OsrmDirectionsService issues one blocking HTTP request per edge. A fresh
// client per call keeps concurrent variants independent, and the timeouts
// bound how long one slow edge can hold up its route.

#include "OsrmDirectionsService.hpp"
#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

std::string OsrmDirectionsService::buildRequestPath(const Coordinate &from,
                                                    const Coordinate &to) const {
  std::ostringstream path;
  path.setf(std::ios::fixed);
  path << std::setprecision(7);
  // OSRM wants lon,lat
  path << "/route/v1/" << P.profile << "/" << from.lon << "," << from.lat
       << ";" << to.lon << "," << to.lat
       << "?overview=full&geometries=geojson&steps=false";
  return path.str();
}

std::optional<WalkingDirections>
OsrmDirectionsService::toDirections(const OsrmResponse &resp) {
  if (!resp.ok())
    return std::nullopt;
  const OsrmRoute &route = resp.routes.front();
  WalkingDirections out;
  out.points.reserve(route.geometry.coordinates.size());
  for (const auto &c : route.geometry.coordinates)
    out.points.push_back(toCoordinate(c));
  out.distance_m = route.distance;
  out.travel_time_s = route.duration;
  return out;
}

std::optional<WalkingDirections>
OsrmDirectionsService::walkingDirections(const Coordinate &from,
                                         const Coordinate &to) {
  const std::string path = buildRequestPath(from, to);

  httplib::Client cli(P.host, P.port);
  cli.set_connection_timeout(P.timeout_s, 0);
  cli.set_read_timeout(P.timeout_s, 0);
  // OSRM needs the ',' and ';' of the coordinate list unescaped
  cli.set_url_encode(false);

  auto res = cli.Get(path);
  if (!res) {
    std::cerr << "[osrm] GET " << path
              << " failed: " << httplib::to_string(res.error()) << "\n";
    return std::nullopt;
  }
  if (res->status != 200 && res->status != 400) {
    // OSRM answers 400 with a JSON body for NoRoute / InvalidQuery
    std::cerr << "[osrm] GET " << path << " -> " << res->status << "\n";
    return std::nullopt;
  }

  try {
    OsrmResponse resp = nlohmann::json::parse(res->body).get<OsrmResponse>();
    if (!resp.ok()) {
      std::cerr << "[osrm] " << resp.code
                << (resp.message.empty() ? "" : ": " + resp.message) << "\n";
      return std::nullopt;
    }
    return toDirections(resp);
  } catch (const std::exception &e) {
    std::cerr << "[osrm] cannot parse response: " << e.what() << "\n";
    return std::nullopt;
  }
}
