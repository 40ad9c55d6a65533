#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Parameters controlling route synthesis. Defaults are the empirical values
// every builder is calibrated against.
struct GenerationParams {
  double stride_m = 0.8;           // metres per step when resolving goals
  double walking_speed_mps = 1.4;  // used for time goals and durations
  bool use_geometric = true;
  bool use_street = false;
  bool parallel = true;            // std::launch::async vs deferred
  std::optional<uint64_t> meander_seed;
  bool verbose = false;
  double max_target_m = 100000.0;  // longer goals are refused

  static GenerationParams from_json(const nlohmann::json &j) {
    GenerationParams p;
    if (j.contains("stride_m"))
      p.stride_m = j.at("stride_m").get<double>();
    if (j.contains("walking_speed_mps"))
      p.walking_speed_mps = j.at("walking_speed_mps").get<double>();
    if (j.contains("strategies")) {
      p.use_geometric = false;
      p.use_street = false;
      for (const auto &s : j.at("strategies")) {
        const auto name = s.get<std::string>();
        if (name == "geometric")
          p.use_geometric = true;
        else if (name == "street")
          p.use_street = true;
        else
          throw std::invalid_argument("unknown strategy '" + name + "'");
      }
    }
    if (j.contains("launch")) {
      const auto launch = j.at("launch").get<std::string>();
      if (launch != "async" && launch != "deferred")
        throw std::invalid_argument("launch must be 'async' or 'deferred'");
      p.parallel = (launch == "async");
    }
    if (j.contains("meander_seed") && !j.at("meander_seed").is_null())
      p.meander_seed = j.at("meander_seed").get<uint64_t>();
    if (j.contains("verbose"))
      p.verbose = j.at("verbose").get<bool>();
    if (j.contains("max_target_m"))
      p.max_target_m = j.at("max_target_m").get<double>();
    if (!(p.stride_m > 0.0) || !(p.walking_speed_mps > 0.0))
      throw std::invalid_argument("stride_m and walking_speed_mps must be > 0");
    if (!(p.max_target_m > 0.0) || !std::isfinite(p.max_target_m))
      throw std::invalid_argument("max_target_m must be a positive number");
    return p;
  }
};

// Where to find the OSRM routing daemon.
struct OsrmParams {
  std::string host = "127.0.0.1";
  int port = 5000;
  std::string profile = "foot";
  int timeout_s = 5; // per directions call

  static OsrmParams from_json(const nlohmann::json &j) {
    OsrmParams p;
    if (j.contains("host"))
      p.host = j.at("host").get<std::string>();
    if (j.contains("port"))
      p.port = j.at("port").get<int>();
    if (j.contains("profile"))
      p.profile = j.at("profile").get<std::string>();
    if (j.contains("timeout_s"))
      p.timeout_s = j.at("timeout_s").get<int>();
    return p;
  }
};

// MySQL connection settings. DB_* environment variables override the file.
struct DatabaseParams {
  bool enabled = false;
  std::string host = "127.0.0.1";
  unsigned int port = 3306;
  std::string user = "walkroute_user";
  std::string password = "changeme-user";
  std::string schema = "walkroute";
  int retention_hours = 24;           // older candidates are purged
  std::size_t memory_capacity = 10000; // in-memory store bound when disabled

  static DatabaseParams from_json(const nlohmann::json &j) {
    DatabaseParams p;
    if (j.contains("enabled"))
      p.enabled = j.at("enabled").get<bool>();
    if (j.contains("host"))
      p.host = j.at("host").get<std::string>();
    if (j.contains("port"))
      p.port = j.at("port").get<unsigned int>();
    if (j.contains("user"))
      p.user = j.at("user").get<std::string>();
    if (j.contains("password"))
      p.password = j.at("password").get<std::string>();
    if (j.contains("schema"))
      p.schema = j.at("schema").get<std::string>();
    if (j.contains("retention_hours"))
      p.retention_hours = j.at("retention_hours").get<int>();
    if (j.contains("memory_capacity"))
      p.memory_capacity = j.at("memory_capacity").get<std::size_t>();
    if (p.retention_hours < 0 || p.memory_capacity == 0)
      throw std::invalid_argument(
          "retention_hours must be >= 0 and memory_capacity > 0");

    if (const char *v = std::getenv("DB_HOST"))
      p.host = v;
    if (const char *v = std::getenv("DB_USER"))
      p.user = v;
    if (const char *v = std::getenv("DB_PASS"))
      p.password = v;
    if (const char *v = std::getenv("DB_NAME"))
      p.schema = v;
    if (const char *v = std::getenv("DB_PORT"))
      p.port = static_cast<unsigned int>(std::atoi(v));
    return p;
  }
};
