#pragma once
#include "core/RouteStore.hpp"
#include "models/params.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <mysql/mysql.h>

// RouteStore over the generated_routes table (see config/schema.sql).
class MySQLRouteStore final : public RouteStore {
public:
  // Throws std::runtime_error when the connection cannot be established.
  explicit MySQLRouteStore(const DatabaseParams &params);
  ~MySQLRouteStore();

  MySQLRouteStore(const MySQLRouteStore &) = delete;
  MySQLRouteStore &operator=(const MySQLRouteStore &) = delete;

  void save(const Route &route) override;
  std::optional<Route> find(const std::string &id) override;
  bool ping() override;

  // Deletes candidates older than the retention window; returns rows removed.
  // save() also calls this, at most once per kPurgeInterval.
  std::size_t purgeExpired();
  const char *kind() const override { return "mysql"; }

private:
  static constexpr std::chrono::minutes kPurgeInterval{10};

  MYSQL *conn_ = nullptr;
  int retention_hours_; // 0 keeps everything
  std::chrono::steady_clock::time_point last_purge_{};
  std::mutex mu_; // one connection, serialise statements

  std::size_t purgeLocked();
};
