#pragma once

#include <memory>

#include "dispatch/core/v1/types.pb.h"
#include "internal/config/settings.hpp"
#include "internal/routing/route_provider.hpp"

namespace dispatch::fare {

struct Quote {
  int64_t     amount = 0;
  std::string currency;
  routing::Route route;
};

/*
  amount = max(minimum, base + per_km * distance + per_minute * duration)
  rounded to minor units, per service type.
*/
class FareCalculator {
 public:
  FareCalculator(std::shared_ptr<routing::RouteProvider> routes, std::map<dispatch::core::v1::ServiceType, config::FareSchedule> fares);

  Quote Estimate(dispatch::core::v1::ServiceType service, const geo::LatLng& pickup, const geo::LatLng& dropoff) const;

  // Pure pricing for a known route.
  int64_t Price(dispatch::core::v1::ServiceType service, double distance_km, int duration_min) const;

  const config::FareSchedule& Schedule(dispatch::core::v1::ServiceType service) const;

 private:
  std::shared_ptr<routing::RouteProvider>                        routes_;
  std::map<dispatch::core::v1::ServiceType, config::FareSchedule> fares_;
};

} // namespace dispatch::fare
