#include "internal/fare/fare_calculator.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace dispatch::fare {

FareCalculator::FareCalculator(std::shared_ptr<routing::RouteProvider> routes,
                               std::map<dispatch::core::v1::ServiceType, config::FareSchedule> fares)
    : routes_(std::move(routes)), fares_(std::move(fares)) {
}

const config::FareSchedule& FareCalculator::Schedule(dispatch::core::v1::ServiceType service) const {
  auto it = fares_.find(service);
  if (it == fares_.end()) {
    throw util::InvalidArgument("unsupported service type " + dispatch::core::v1::ServiceType_Name(service));
  }
  return it->second;
}

int64_t FareCalculator::Price(dispatch::core::v1::ServiceType service, double distance_km, int duration_min) const {
  const auto& schedule = Schedule(service);

  const double raw = static_cast<double>(schedule.base_fare) + static_cast<double>(schedule.per_km) * distance_km +
                     static_cast<double>(schedule.per_minute) * duration_min;
  return std::max<int64_t>(schedule.minimum_fare, std::llround(raw));
}

Quote FareCalculator::Estimate(dispatch::core::v1::ServiceType service, const geo::LatLng& pickup, const geo::LatLng& dropoff) const {
  if (!geo::IsValid(pickup) || !geo::IsValid(dropoff)) {
    throw util::InvalidArgument("pickup and dropoff must be valid coordinates");
  }

  Quote quote;
  quote.route    = routes_->Estimate(pickup, dropoff);
  quote.amount   = Price(service, quote.route.distance_km, quote.route.duration_min);
  quote.currency = Schedule(service).currency;
  return quote;
}

} // namespace dispatch::fare
