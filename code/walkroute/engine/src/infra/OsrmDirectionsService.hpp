#pragma once
#include "core/DirectionsService.hpp"
#include "models/OsrmResponse.hpp"
#include "models/params.hpp"
#include <optional>
#include <string>
#include <utility>

// DirectionsService backed by an OSRM routing daemon's /route endpoint.
class OsrmDirectionsService final : public DirectionsService {
public:
  explicit OsrmDirectionsService(OsrmParams params) : P(std::move(params)) {}

  std::optional<WalkingDirections>
  walkingDirections(const Coordinate &from, const Coordinate &to) override;

  // Path + query for a two-point walking route request.
  std::string buildRequestPath(const Coordinate &from,
                               const Coordinate &to) const;

  // Converts the first route of a parsed response; nullopt if OSRM reported
  // no route.
  static std::optional<WalkingDirections>
  toDirections(const OsrmResponse &resp);

private:
  OsrmParams P;
};
