#pragma once

#include "models/CoreTypes.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using Coord = std::array<double, 2>; // [lon, lat]
using Json = nlohmann::json;

// Structures modelling the subset of OSRM's /route JSON response we care
// about.

// ---------- Geometry ----------
struct Geometry {
  std::string type; // e.g., "LineString"
  std::vector<Coord> coordinates;
};

// ---------- Legs --------------
struct Leg {
  std::string summary;
  double weight = 0.0;
  double duration = 0.0; // seconds
  double distance = 0.0; // metres
};

// ------------ Route ------------
struct OsrmRoute {
  Geometry geometry;
  std::vector<Leg> legs;
  std::string weight_name;
  double weight = 0.0;
  double duration = 0.0;
  double distance = 0.0;
};

// Input coordinate as snapped by OSRM onto the street network.
struct Waypoint {
  std::string name;
  double distance = 0.0; // metres moved while snapping
  Coord location{0.0, 0.0};
};

struct OsrmResponse {
  std::string code;
  std::string message; // only set on errors
  std::vector<OsrmRoute> routes;
  std::vector<Waypoint> waypoints;

  bool ok() const { return code == "Ok" && !routes.empty(); }
};

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  g.type = j.value("type", "");
  g.coordinates.clear();
  if (j.contains("coordinates") && j["coordinates"].is_array()) {
    for (const auto &pt : j["coordinates"]) {
      // skip anything that is not at least an [x, y] pair
      if (pt.is_array() && pt.size() >= 2)
        g.coordinates.push_back({pt[0].get<double>(), pt[1].get<double>()});
    }
  }
}

// --- Legs ----
inline void from_json(const Json &j, Leg &l) {
  l.summary = j.value("summary", "");
  l.weight = j.value("weight", 0.0);
  l.duration = j.value("duration", 0.0);
  l.distance = j.value("distance", 0.0);
}

// --- Route ----
inline void from_json(const Json &j, OsrmRoute &r) {
  if (j.contains("geometry") && j["geometry"].is_object())
    r.geometry = j["geometry"].get<Geometry>();
  else if (j.contains("geometry") && j["geometry"].is_string())
    throw std::runtime_error(
        "encoded polyline geometry not supported, request geometries=geojson");
  r.weight_name = j.value("weight_name", "");
  r.weight = j.value("weight", 0.0);
  r.duration = j.value("duration", 0.0);
  r.distance = j.value("distance", 0.0);

  r.legs.clear();
  if (j.contains("legs") && j["legs"].is_array()) {
    for (const auto &L : j["legs"])
      r.legs.push_back(L.get<Leg>());
  }
}

// --- Waypoint ----
inline void from_json(const Json &j, Waypoint &w) {
  w.name = j.value("name", "");
  w.distance = j.value("distance", 0.0);
  if (j.contains("location") && j["location"].is_array() &&
      j["location"].size() >= 2) {
    w.location = {j["location"][0].get<double>(),
                  j["location"][1].get<double>()};
  }
}

// --- OsrmResponse ----
inline void from_json(const Json &j, OsrmResponse &r) {
  r.code = j.value("code", "Error");
  r.message = j.value("message", "");
  r.routes.clear();
  if (j.contains("routes") && j["routes"].is_array()) {
    for (const auto &R : j["routes"])
      r.routes.push_back(R.get<OsrmRoute>());
  }
  r.waypoints.clear();
  if (j.contains("waypoints") && j["waypoints"].is_array()) {
    for (const auto &w : j["waypoints"])
      r.waypoints.push_back(w.get<Waypoint>());
  }
}

inline Coordinate toCoordinate(const Coord &c) {
  return Coordinate{c[1], c[0]};
}
