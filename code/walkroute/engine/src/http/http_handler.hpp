#pragma once

#include "core/RouteGenerator.hpp" // RouteGenerator
#include "core/RouteStore.hpp"     // RouteStore
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(const RouteGenerator &generator, RouteStore &store)
      : generator_(generator), store_(store) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  const RouteGenerator &generator_;
  RouteStore &store_;

  // Individual request handlers
  void handleRoutes(const httplib::Request &req, httplib::Response &res);
  void handleTarget(const httplib::Request &req, httplib::Response &res);
  void handleRoute(const httplib::Request &req, httplib::Response &res);
  void handleDBPing(const httplib::Request &req, httplib::Response &res);

  // Parses req.body; on failure fills `res` with a 400 and returns false.
  bool parseBody(const httplib::Request &req, httplib::Response &res,
                 nlohmann::json &out);
  std::string goalTooLong(const Goal &goal) const;
};
