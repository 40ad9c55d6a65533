#include "http_handler.hpp"
#include "core/GeoUtils.hpp"
#include "http/json_errors.hpp"
#include "models/CoreTypes.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

static void send_error(httplib::Response &res, int status,
                       const std::string &message) {
  res.status = status;
  res.set_content(json{{"error", message}}.dump(), "application/json");
}

std::string HttpHandler::goalTooLong(const Goal &goal) const {
  return "goal resolves to " + std::to_string(generator_.targetDistance(goal)) +
         " m, limit is " + std::to_string(generator_.params().max_target_m) +
         " m";
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "routes") {
    handleRoutes(req, res);
  } else if (action == "target") {
    handleTarget(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "route") {
    handleRoute(req, res);
  } else if (action == "dbping") {
    handleDBPing(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

bool HttpHandler::parseBody(const httplib::Request &req,
                            httplib::Response &res, json &out) {
  try {
    out = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_json(req.body, e).dump(2), "application/json");
    return false;
  }
  if (!out.is_object()) {
    send_error(res, 400, "request body must be a JSON object");
    return false;
  }
  return true;
}

// ===== POST: /routes =====
// {"start":{"lat":..,"lon":..},"goal":{"kind":"distance","value":3}}

void HttpHandler::handleRoutes(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  Coordinate start;
  Goal goal;
  try {
    start = body.at("start").get<Coordinate>();
    goal = body.at("goal").get<Goal>();
  } catch (const std::exception &e) {
    send_error(res, 400, e.what());
    return;
  }
  if (!start.isValid()) {
    send_error(res, 400, "start coordinate out of range");
    return;
  }
  if (!GeoUtils::isUsableStart(start)) {
    send_error(res, 400, "start latitude beyond +/-" +
                             std::to_string(GeoUtils::kMaxStartLatitude) +
                             " degrees is not supported");
    return;
  }
  if (!generator_.acceptsGoal(goal)) {
    send_error(res, 400, goalTooLong(goal));
    return;
  }

  std::vector<Route> routes = generator_.generateRoutes(start, goal);
  for (const auto &r : routes)
    store_.save(r); // throws on DB failure -> 500 from the endpoint wrapper

  std::cout << "[INFO] /routes goal=" << goal.value << " "
            << GoalKindUnit(goal.kind) << " -> " << routes.size()
            << " routes\n";

  json out = {{"target_m", generator_.targetDistance(goal)},
              {"routes", routes}};
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /target =====

void HttpHandler::handleTarget(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  Goal goal;
  try {
    goal = body.at("goal").get<Goal>();
  } catch (const std::exception &e) {
    send_error(res, 400, e.what());
    return;
  }
  if (!generator_.acceptsGoal(goal)) {
    send_error(res, 400, goalTooLong(goal));
    return;
  }
  json out = {{"goal", goal}, {"target_m", generator_.targetDistance(goal)}};
  res.set_content(out.dump(), "application/json");
}

// ===== GET: /route?id=<uuid> =====

void HttpHandler::handleRoute(const httplib::Request &req,
                              httplib::Response &res) {
  if (!req.has_param("id")) {
    send_error(res, 400, "missing ?id=<route id>");
    return;
  }
  const std::string id = req.get_param_value("id");
  auto route = store_.find(id);
  if (!route) {
    send_error(res, 404, "no route with id " + id);
    return;
  }
  res.set_content(json(*route).dump(), "application/json");
}

// ===== GET: /dbping =====

void HttpHandler::handleDBPing(const httplib::Request &req,
                               httplib::Response &res) {
  const bool ok = store_.ping();
  if (!ok) {
    std::cerr << "[dbping] " << store_.kind() << " store not reachable\n";
    res.status = 503;
  }
  res.set_content(json{{"ok", ok}, {"store", store_.kind()}}.dump(),
                  "application/json");
}
