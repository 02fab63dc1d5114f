#include "internal/fare/fare_calculator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/geo/geo.hpp"
#include "internal/routing/route_provider.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::fare::FareCalculator;
using dispatch::geo::LatLng;
using dispatch::routing::FallbackRouteProvider;
using dispatch::routing::Route;
using dispatch::routing::RouteProvider;
using dispatch::routing::StraightLineRouteProvider;
using dispatch::testing::North;
using dispatch::testing::Throws;

class FixedRouteProvider final : public RouteProvider {
 public:
  explicit FixedRouteProvider(Route route) : route_(route) {
  }

  Route Estimate(const LatLng&, const LatLng&) override {
    ++calls;
    return route_;
  }

  int calls = 0;

 private:
  Route route_;
};

class DownRouteProvider final : public RouteProvider {
 public:
  Route Estimate(const LatLng&, const LatLng&) override {
    throw dispatch::util::UpstreamUnavailable("routing backend timed out");
  }
};

FareCalculator Calculator(std::shared_ptr<RouteProvider> routes) {
  return FareCalculator(std::move(routes), dispatch::config::DefaultFares());
}

void TestHaversine() {
  const LatLng a{0, 0};
  const LatLng b{0, 1};
  // one degree of longitude on the equator
  assert(std::fabs(dispatch::geo::HaversineKm(a, b) - 111.195) < 0.01);
  assert(dispatch::geo::HaversineKm(a, a) == 0);

  const auto ten_km_north = North(dispatch::testing::kPickup, 10);
  assert(std::fabs(dispatch::geo::HaversineKm(dispatch::testing::kPickup, ten_km_north) - 10.0) < 0.001);
}

void TestEtaRoundsUp() {
  assert(dispatch::geo::EtaMinutes(0, 30) == 0);
  assert(dispatch::geo::EtaMinutes(0.1, 30) == 1);
  assert(dispatch::geo::EtaMinutes(15, 30) == 30);
  assert(dispatch::geo::EtaMinutes(15.01, 30) == 31);
}

void TestCoordinateValidation() {
  assert(dispatch::geo::IsValid({0, 0}));
  assert(dispatch::geo::IsValid({-90, 180}));
  assert(!dispatch::geo::IsValid({91, 0}));
  assert(!dispatch::geo::IsValid({0, -180.5}));
  assert(!dispatch::geo::IsValid({std::nan(""), 0}));
}

void TestPriceFormula() {
  auto calc = Calculator(std::make_shared<StraightLineRouteProvider>(30));

  // 250 + 120 * 10 + 25 * 20
  assert(calc.Price(SERVICE_TYPE_STANDARD, 10, 20) == 1950);
  // 500 + 200 * 10 + 40 * 20
  assert(calc.Price(SERVICE_TYPE_PREMIUM, 10, 20) == 3300);
  // 200 + 80 * 2.5 + 15 * 5
  assert(calc.Price(SERVICE_TYPE_DELIVERY, 2.5, 5) == 475);
}

void TestMinimumFareApplies() {
  auto calc = Calculator(std::make_shared<StraightLineRouteProvider>(30));
  assert(calc.Price(SERVICE_TYPE_STANDARD, 0.5, 1) == 500);
  assert(calc.Price(SERVICE_TYPE_PREMIUM, 0, 0) == 1000);
}

void TestRoundingToMinorUnits() {
  auto calc = Calculator(std::make_shared<StraightLineRouteProvider>(30));
  // 250 + 120 * 3.333 + 25 * 7 = 824.96
  assert(calc.Price(SERVICE_TYPE_STANDARD, 3.333, 7) == 825);
}

void TestEstimateUsesRoute() {
  auto routes = std::make_shared<FixedRouteProvider>(Route{12.0, 25, false});
  auto calc   = Calculator(routes);

  auto quote = calc.Estimate(SERVICE_TYPE_STANDARD, {1, 1}, {1.1, 1.1});
  assert(routes->calls == 1);
  assert(quote.amount == 250 + 120 * 12 + 25 * 25);
  assert(quote.currency == "USD");
  assert(quote.route.distance_km == 12.0);
  assert(quote.route.duration_min == 25);
  assert(!quote.route.fallback);
}

void TestStraightLineEstimate() {
  auto calc  = Calculator(std::make_shared<StraightLineRouteProvider>(30));
  auto quote = calc.Estimate(SERVICE_TYPE_STANDARD, dispatch::testing::kPickup, North(dispatch::testing::kPickup, 15));
  assert(std::fabs(quote.route.distance_km - 15.0) < 0.001);
  assert(quote.route.duration_min == 30 || quote.route.duration_min == 31);
  assert(quote.route.fallback);
}

void TestFallbackWhenRoutingIsDown() {
  auto provider = std::make_shared<FallbackRouteProvider>(std::make_shared<DownRouteProvider>(), std::make_shared<StraightLineRouteProvider>(30));
  auto calc     = Calculator(provider);

  auto quote = calc.Estimate(SERVICE_TYPE_STANDARD, dispatch::testing::kPickup, North(dispatch::testing::kPickup, 10));
  assert(quote.route.fallback);
  assert(std::fabs(quote.route.distance_km - 10.0) < 0.001);
  assert(quote.route.duration_min == 20 || quote.route.duration_min == 21);
  assert(quote.amount == calc.Price(SERVICE_TYPE_STANDARD, quote.route.distance_km, quote.route.duration_min));
  assert(quote.amount >= 1950);
}

void TestFallbackPrefersPrimary() {
  auto primary  = std::make_shared<FixedRouteProvider>(Route{4.0, 9, false});
  auto provider = std::make_shared<FallbackRouteProvider>(primary, std::make_shared<StraightLineRouteProvider>(30));

  auto route = provider->Estimate({0, 0}, {0, 1});
  assert(primary->calls == 1);
  assert(route.distance_km == 4.0);
  assert(!route.fallback);
}

void TestRejectsBadInput() {
  auto calc = Calculator(std::make_shared<StraightLineRouteProvider>(30));
  assert(Throws<dispatch::util::InvalidArgument>([&] { calc.Estimate(SERVICE_TYPE_STANDARD, {95, 0}, {0, 0}); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { calc.Price(SERVICE_TYPE_UNSPECIFIED, 1, 1); }));
}

} // namespace

int main() {
  TestHaversine();
  TestEtaRoundsUp();
  TestCoordinateValidation();
  TestPriceFormula();
  TestMinimumFareApplies();
  TestRoundingToMinorUnits();
  TestEstimateUsesRoute();
  TestStraightLineEstimate();
  TestFallbackWhenRoutingIsDown();
  TestFallbackPrefersPrimary();
  TestRejectsBadInput();

  std::cout << "dispatch_unit_fare_calculator: pass\n";
  return 0;
}
