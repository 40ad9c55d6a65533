// Entry point for the walkroute HTTP server.  It loads configuration, wires
// the route generator to its directions backend and route store, and exposes
// the REST endpoints handled by `HttpHandler`.

#include "core/RouteGenerator.hpp"
#include "core/RouteStore.hpp"
#include "http/http_handler.hpp"
#include "infra/MySQLRouteStore.hpp"
#include "infra/OsrmDirectionsService.hpp"
#include "models/params.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << cfg_path << "\n";
    return 1;
  }
  json settings;
  GenerationParams gen_params;
  OsrmParams osrm_params;
  DatabaseParams db_params;
  try {
    cfg >> settings;
    gen_params =
        GenerationParams::from_json(settings.value("generation", json::object()));
    osrm_params = OsrmParams::from_json(settings.value("osrm", json::object()));
    db_params =
        DatabaseParams::from_json(settings.value("database", json::object()));
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Bad configuration in " << cfg_path << ": "
              << e.what() << "\n";
    return 1;
  }
  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;

  // ---------------------- Route generation --------------------------------
  std::shared_ptr<DirectionsService> directions;
  if (gen_params.use_street) {
    directions = std::make_shared<OsrmDirectionsService>(osrm_params);
    std::cout << "[DEBUG] OSRM at " << osrm_params.host << ":"
              << osrm_params.port << " profile=" << osrm_params.profile
              << std::endl;
  }
  const RouteGenerator generator =
      RouteGenerator::fromParams(gen_params, directions);
  if (generator.builderCount() == 0) {
    std::cerr << "[ERROR] No route strategy enabled\n";
    return 1;
  }

  // ---------------------- Route store -------------------------------------
  std::unique_ptr<RouteStore> store;
  if (db_params.enabled) {
    try {
      store = std::make_unique<MySQLRouteStore>(db_params);
    } catch (const std::exception &e) {
      std::cerr << "[main] mysql: " << e.what() << "\n";
      return 1;
    }
  } else {
    store = std::make_unique<InMemoryRouteStore>(db_params.memory_capacity);
  }
  std::cout << "[DEBUG] Route store: " << store->kind() << std::endl;

  HttpHandler handler(generator, *store);

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // Simple echo endpoint useful during development
  server.Post("/_echo", [](const auto &req, auto &res) {
    std::string reply = "Received POST to " + req.path +
                        ", content-length=" + std::to_string(req.body.size());
    res.set_content(reply, "text/plain");
  });

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      } catch (...) {
        std::cerr << "[POST " << action << "] EXCEPTION: unknown\n";
        res.status = 500;
        res.set_content("exception: unknown", "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      } catch (...) {
        std::cerr << "[GET " << action << "] EXCEPTION: unknown\n";
        res.status = 500;
        res.set_content("exception: unknown", "text/plain");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] Cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}
