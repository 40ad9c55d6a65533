// MySQLRouteStore persists generated candidate routes as JSON plus a few
// summary columns for ad-hoc queries.

#include "MySQLRouteStore.hpp"
#include "core/GeoUtils.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {
struct StmtCloser {
  void operator()(MYSQL_STMT *s) const {
    if (s)
      mysql_stmt_close(s);
  }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

StmtPtr prepare(MYSQL *conn, const char *sql) {
  StmtPtr stmt(mysql_stmt_init(conn));
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt.get(), sql, strlen(sql)))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  return stmt;
}
} // namespace

// Establish connection using the configured host and credentials
MySQLRouteStore::MySQLRouteStore(const DatabaseParams &p)
    : retention_hours_(p.retention_hours) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  if (!mysql_real_connect(conn_, p.host.c_str(), p.user.c_str(),
                          p.password.c_str(), p.schema.c_str(), p.port,
                          nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    conn_ = nullptr;
    throw std::runtime_error("connect failed: " + err);
  }
}

MySQLRouteStore::~MySQLRouteStore() {
  if (conn_)
    mysql_close(conn_);
}

// Insert or update one generated route
void MySQLRouteStore::save(const Route &r) {
  static const char *SQL = R"SQL(
      INSERT INTO generated_routes
        (route_id, name, distance_m, steps, duration_s, difficulty, terrain,
         bbox_min_lat, bbox_min_lon, bbox_max_lat, bbox_max_lon, route_json)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
      ON DUPLICATE KEY UPDATE
        name = VALUES(name),
        distance_m = VALUES(distance_m),
        steps = VALUES(steps),
        duration_s = VALUES(duration_s),
        difficulty = VALUES(difficulty),
        terrain = VALUES(terrain),
        bbox_min_lat = VALUES(bbox_min_lat),
        bbox_min_lon = VALUES(bbox_min_lon),
        bbox_max_lat = VALUES(bbox_max_lat),
        bbox_max_lon = VALUES(bbox_max_lon),
        route_json = VALUES(route_json)
    )SQL";

  const std::string json = nlohmann::json(r).dump();
  const std::string difficulty = DifficultyToString(r.difficulty);
  const std::string terrain = TerrainToString(r.terrain);
  GeoUtils::BBox bb = GeoUtils::computeBBox(r.points);
  double distance = r.estimated_distance_m;
  double duration = r.estimated_duration_s;
  int steps = r.estimated_steps;

  std::lock_guard<std::mutex> lock(mu_);
  const auto now = std::chrono::steady_clock::now();
  if (retention_hours_ > 0 && now - last_purge_ >= kPurgeInterval) {
    last_purge_ = now;
    try {
      purgeLocked();
    } catch (const std::exception &e) {
      // a failed purge must not lose the route being saved
      std::cerr << "[mysql] purge failed: " << e.what() << "\n";
    }
  }
  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND b[12];
  memset(b, 0, sizeof(b));

  auto bind_string = [](MYSQL_BIND &bind, const std::string &s,
                        unsigned long &len) {
    len = s.size();
    bind.buffer_type = MYSQL_TYPE_STRING;
    bind.buffer = (void *)s.c_str();
    bind.buffer_length = len;
    bind.length = &len;
  };
  unsigned long id_len, name_len, diff_len, terr_len, json_len;

  // route_id
  bind_string(b[0], r.id, id_len);
  // name
  bind_string(b[1], r.name, name_len);
  // distance_m
  b[2].buffer_type = MYSQL_TYPE_DOUBLE;
  b[2].buffer = &distance;
  // steps
  b[3].buffer_type = MYSQL_TYPE_LONG;
  b[3].buffer = &steps;
  // duration_s
  b[4].buffer_type = MYSQL_TYPE_DOUBLE;
  b[4].buffer = &duration;
  // difficulty / terrain
  bind_string(b[5], difficulty, diff_len);
  bind_string(b[6], terrain, terr_len);
  // bbox
  b[7].buffer_type = MYSQL_TYPE_DOUBLE;
  b[7].buffer = &bb.min_lat;
  b[8].buffer_type = MYSQL_TYPE_DOUBLE;
  b[8].buffer = &bb.min_lon;
  b[9].buffer_type = MYSQL_TYPE_DOUBLE;
  b[9].buffer = &bb.max_lat;
  b[10].buffer_type = MYSQL_TYPE_DOUBLE;
  b[10].buffer = &bb.max_lon;
  // route_json
  bind_string(b[11], json, json_len);

  if (mysql_stmt_bind_param(stmt.get(), b))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
}

// Fetch a route by id; route_json is read in two passes since its length is
// unknown up front.
std::optional<Route> MySQLRouteStore::find(const std::string &id) {
  static const char *SQL =
      "SELECT route_json FROM generated_routes WHERE route_id = ?";

  std::lock_guard<std::mutex> lock(mu_);
  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND pb[1];
  memset(pb, 0, sizeof(pb));
  unsigned long id_len = id.size();
  pb[0].buffer_type = MYSQL_TYPE_STRING;
  pb[0].buffer = (void *)id.c_str();
  pb[0].buffer_length = id_len;
  pb[0].length = &id_len;
  if (mysql_stmt_bind_param(stmt.get(), pb))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));

  MYSQL_BIND rb[1];
  memset(rb, 0, sizeof(rb));
  unsigned long json_len = 0;
  // bool on MySQL 8, my_bool on MariaDB
  std::remove_pointer_t<decltype(MYSQL_BIND::is_null)> is_null = 0;
  rb[0].buffer_type = MYSQL_TYPE_STRING;
  rb[0].buffer = nullptr;
  rb[0].buffer_length = 0;
  rb[0].length = &json_len;
  rb[0].is_null = &is_null;
  if (mysql_stmt_bind_result(stmt.get(), rb))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_store_result(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));

  const int rc = mysql_stmt_fetch(stmt.get());
  if (rc == MYSQL_NO_DATA)
    return std::nullopt;
  if (rc == 1)
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (is_null)
    return std::nullopt;

  std::vector<char> buf(json_len);
  rb[0].buffer = buf.data();
  rb[0].buffer_length = json_len;
  if (json_len > 0 && mysql_stmt_fetch_column(stmt.get(), rb, 0, 0))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));

  return nlohmann::json::parse(buf.begin(), buf.end()).get<Route>();
}

std::size_t MySQLRouteStore::purgeExpired() {
  std::lock_guard<std::mutex> lock(mu_);
  last_purge_ = std::chrono::steady_clock::now();
  return purgeLocked();
}

// Uses idx_generated_routes_created
std::size_t MySQLRouteStore::purgeLocked() {
  if (retention_hours_ <= 0)
    return 0;
  static const char *SQL = "DELETE FROM generated_routes "
                           "WHERE created_at < NOW() - INTERVAL ? HOUR";
  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND b[1];
  memset(b, 0, sizeof(b));
  int hours = retention_hours_;
  b[0].buffer_type = MYSQL_TYPE_LONG;
  b[0].buffer = &hours;
  if (mysql_stmt_bind_param(stmt.get(), b))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));

  const auto removed =
      static_cast<std::size_t>(mysql_stmt_affected_rows(stmt.get()));
  if (removed > 0)
    std::cout << "[mysql] purged " << removed << " expired routes\n";
  return removed;
}

bool MySQLRouteStore::ping() {
  std::lock_guard<std::mutex> lock(mu_);
  return conn_ && mysql_ping(conn_) == 0;
}
