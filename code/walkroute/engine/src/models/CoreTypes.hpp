#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Json = nlohmann::json;

// Basic WGS84 position in degrees.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;

  bool isValid() const {
    return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 &&
           lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
  }
  bool operator==(const Coordinate &o) const {
    return lat == o.lat && lon == o.lon;
  }
  bool operator!=(const Coordinate &o) const { return !(*this == o); }
};

// What the walker asked for.
enum class GoalKind : uint8_t { Steps, Distance, Time };

struct Goal {
  GoalKind kind = GoalKind::Distance;
  double value = 0.0; // steps, kilometres or minutes depending on kind
};

inline const char *GoalKindToString(GoalKind kind) {
  switch (kind) {
  case GoalKind::Steps:
    return "steps";
  case GoalKind::Distance:
    return "distance";
  case GoalKind::Time:
    return "time";
  }
  return "distance";
}

inline const char *GoalKindUnit(GoalKind kind) {
  switch (kind) {
  case GoalKind::Steps:
    return "steps";
  case GoalKind::Distance:
    return "km";
  case GoalKind::Time:
    return "minutes";
  }
  return "km";
}

// Throws std::invalid_argument on an unknown name.
inline GoalKind GoalKindFromString(const std::string &s) {
  if (s == "steps")
    return GoalKind::Steps;
  if (s == "distance")
    return GoalKind::Distance;
  if (s == "time")
    return GoalKind::Time;
  throw std::invalid_argument("unknown goal kind '" + s + "'");
}

enum class Difficulty : uint8_t { Easy, Moderate, Challenging };
enum class Terrain : uint8_t { Urban, Park, Mixed };

inline const char *DifficultyToString(Difficulty d) {
  switch (d) {
  case Difficulty::Easy:
    return "Easy";
  case Difficulty::Moderate:
    return "Moderate";
  case Difficulty::Challenging:
    return "Challenging";
  }
  return "Easy";
}

inline Difficulty DifficultyFromString(const std::string &s) {
  if (s == "Moderate")
    return Difficulty::Moderate;
  if (s == "Challenging")
    return Difficulty::Challenging;
  return Difficulty::Easy;
}

inline const char *TerrainToString(Terrain t) {
  switch (t) {
  case Terrain::Urban:
    return "Urban";
  case Terrain::Park:
    return "Park";
  case Terrain::Mixed:
    return "Mixed";
  }
  return "Urban";
}

inline Terrain TerrainFromString(const std::string &s) {
  if (s == "Park")
    return Terrain::Park;
  if (s == "Mixed")
    return Terrain::Mixed;
  return Terrain::Urban;
}

// A single vertex of a route, optionally carrying a turn instruction.
struct RoutePoint {
  Coordinate coord;
  std::optional<std::string> instruction;
};

// A closed-loop candidate route. Built once per generation call and never
// mutated after it leaves its builder.
struct Route {
  std::string id;
  std::string name;
  std::vector<RoutePoint> points;
  double estimated_distance_m = 0.0;
  int estimated_steps = 0;
  double estimated_duration_s = 0.0;
  Difficulty difficulty = Difficulty::Easy;
  Terrain terrain = Terrain::Urban;
};

// Step estimate for a path length, floored and clamped to [0, INT_MAX].
inline int EstimateSteps(double distance_m, double steps_per_meter) {
  const double steps = std::floor(distance_m * steps_per_meter);
  if (!(steps > 0.0))
    return 0;
  if (steps >= static_cast<double>(std::numeric_limits<int>::max()))
    return std::numeric_limits<int>::max();
  return static_cast<int>(steps);
}

// ---- JSON ----

inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.lat}, {"lon", c.lon}};
}

inline void from_json(const Json &j, Coordinate &c) {
  c.lat = j.at("lat").get<double>();
  c.lon = j.at("lon").get<double>();
}

inline void to_json(Json &j, const Goal &g) {
  j = Json{{"kind", GoalKindToString(g.kind)}, {"value", g.value}};
}

// Rejects goals that cannot describe a walk (value must be finite and > 0).
inline void from_json(const Json &j, Goal &g) {
  g.kind = GoalKindFromString(j.at("kind").get<std::string>());
  g.value = j.at("value").get<double>();
  if (!std::isfinite(g.value) || g.value <= 0.0)
    throw std::invalid_argument("goal value must be a positive number");
}

inline void to_json(Json &j, const RoutePoint &p) {
  j = Json{{"lat", p.coord.lat}, {"lon", p.coord.lon}};
  if (p.instruction)
    j["instruction"] = *p.instruction;
}

inline void from_json(const Json &j, RoutePoint &p) {
  p.coord.lat = j.at("lat").get<double>();
  p.coord.lon = j.at("lon").get<double>();
  if (j.contains("instruction") && j["instruction"].is_string())
    p.instruction = j["instruction"].get<std::string>();
  else
    p.instruction.reset();
}

inline void to_json(Json &j, const Route &r) {
  j = Json{{"id", r.id},
           {"name", r.name},
           {"points", r.points},
           {"estimated_distance_m", r.estimated_distance_m},
           {"estimated_steps", r.estimated_steps},
           {"estimated_duration_s", r.estimated_duration_s},
           {"difficulty", DifficultyToString(r.difficulty)},
           {"terrain", TerrainToString(r.terrain)}};
}

inline void from_json(const Json &j, Route &r) {
  r.id = j.value("id", "");
  r.name = j.value("name", "");
  r.points.clear();
  if (j.contains("points") && j["points"].is_array()) {
    for (const auto &p : j["points"])
      r.points.push_back(p.get<RoutePoint>());
  }
  r.estimated_distance_m = j.value("estimated_distance_m", 0.0);
  r.estimated_steps = j.value("estimated_steps", 0);
  r.estimated_duration_s = j.value("estimated_duration_s", 0.0);
  r.difficulty = DifficultyFromString(j.value("difficulty", "Easy"));
  r.terrain = TerrainFromString(j.value("terrain", "Urban"));
}
