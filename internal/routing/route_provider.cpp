#include "internal/routing/route_provider.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::routing {

StraightLineRouteProvider::StraightLineRouteProvider(double average_speed_kmh) : average_speed_kmh_(average_speed_kmh) {
}

Route StraightLineRouteProvider::Estimate(const geo::LatLng& from, const geo::LatLng& to) {
  Route route;
  route.distance_km  = geo::HaversineKm(from, to);
  route.duration_min = geo::EtaMinutes(route.distance_km, average_speed_kmh_);
  route.fallback     = true;
  return route;
}

FallbackRouteProvider::FallbackRouteProvider(std::shared_ptr<RouteProvider> primary, std::shared_ptr<RouteProvider> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {
}

Route FallbackRouteProvider::Estimate(const geo::LatLng& from, const geo::LatLng& to) {
  try {
    return primary_->Estimate(from, to);
  } catch (const util::UpstreamUnavailable& e) {
    DISPATCH_LOG_WARN("routing provider unavailable; using straight-line estimate", {observability::StringField("error", e.what())});
  }

  auto route     = fallback_->Estimate(from, to);
  route.fallback = true;
  return route;
}

} // namespace dispatch::routing
