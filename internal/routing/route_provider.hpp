#pragma once

#include <memory>

#include "internal/geo/geo.hpp"

namespace dispatch::routing {

struct Route {
  double distance_km  = 0;
  int    duration_min = 0;
  bool   fallback     = false; // straight-line estimate, not a routed path
};

/*
  Distance/duration source for fares and ETAs.

  Implementations backed by a remote routing service throw
  util::UpstreamUnavailable when it cannot answer.
*/
class RouteProvider {
 public:
  virtual ~RouteProvider() = default;

  virtual Route Estimate(const geo::LatLng& from, const geo::LatLng& to) = 0;
};

class StraightLineRouteProvider final : public RouteProvider {
 public:
  explicit StraightLineRouteProvider(double average_speed_kmh);

  Route Estimate(const geo::LatLng& from, const geo::LatLng& to) override;

 private:
  double average_speed_kmh_;
};

// Uses primary; on UpstreamUnavailable answers from fallback and logs.
class FallbackRouteProvider final : public RouteProvider {
 public:
  FallbackRouteProvider(std::shared_ptr<RouteProvider> primary, std::shared_ptr<RouteProvider> fallback);

  Route Estimate(const geo::LatLng& from, const geo::LatLng& to) override;

 private:
  std::shared_ptr<RouteProvider> primary_;
  std::shared_ptr<RouteProvider> fallback_;
};

} // namespace dispatch::routing
