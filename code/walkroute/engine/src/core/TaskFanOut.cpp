#include "core/TaskFanOut.hpp"
#include <future>
#include <iostream>
#include <system_error>
#include <utility>

std::vector<std::optional<Route>> run_route_tasks(std::vector<RouteTask> tasks,
                                                  bool parallel,
                                                  const char *tag) {
  const auto policy = parallel ? std::launch::async : std::launch::deferred;

  std::vector<std::future<std::optional<Route>>> futures;
  futures.reserve(tasks.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    try {
      futures.push_back(std::async(policy, tasks[i]));
    } catch (const std::system_error &e) {
      // no thread available: fall back to running it here, later
      std::cerr << "[" << tag << "] cannot start variant " << i
                << " on its own thread (" << e.what() << "), deferring\n";
      futures.push_back(std::async(std::launch::deferred, std::move(tasks[i])));
    }
  }

  std::vector<std::optional<Route>> results(futures.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    try {
      results[i] = futures[i].get();
    } catch (const std::exception &e) {
      std::cerr << "[" << tag << "] variant " << i << " failed: " << e.what()
                << "\n";
    } catch (...) {
      std::cerr << "[" << tag << "] variant " << i << " failed: unknown\n";
    }
  }
  return results;
}
