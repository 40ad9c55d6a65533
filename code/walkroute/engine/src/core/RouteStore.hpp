#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Keeps generated candidates around until a client picks one for its walk.
// Only candidates are stored; finished walks are not.
class RouteStore {
public:
  virtual ~RouteStore() = default;

  // Insert or replace by route id
  virtual void save(const Route &route) = 0;
  virtual std::optional<Route> find(const std::string &id) = 0;

  // Liveness check for /dbping
  virtual bool ping() = 0;
  virtual const char *kind() const = 0;
};

// Process-local store, used when no database is configured. Holds at most
// `capacity` routes; the oldest insert is evicted first.
class InMemoryRouteStore final : public RouteStore {
public:
  static constexpr std::size_t kDefaultCapacity = 10000;

  explicit InMemoryRouteStore(std::size_t capacity = kDefaultCapacity)
      : capacity_(capacity > 0 ? capacity : 1) {}

  void save(const Route &route) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = routes_.find(route.id);
    if (it != routes_.end()) {
      it->second = route; // replacing keeps the original age
      return;
    }
    while (routes_.size() >= capacity_) {
      routes_.erase(order_.front());
      order_.pop_front();
    }
    routes_.emplace(route.id, route);
    order_.push_back(route.id);
  }
  std::optional<Route> find(const std::string &id) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = routes_.find(id);
    if (it == routes_.end())
      return std::nullopt;
    return it->second;
  }
  bool ping() override { return true; }
  const char *kind() const override { return "memory"; }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mu_);
    return routes_.size();
  }
  std::size_t capacity() const noexcept { return capacity_; }

private:
  const std::size_t capacity_;
  std::mutex mu_;
  std::unordered_map<std::string, Route> routes_;
  std::deque<std::string> order_; // ids, oldest first
};
