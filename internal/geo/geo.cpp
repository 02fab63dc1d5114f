#include "internal/geo/geo.hpp"

#include <cmath>

namespace dispatch::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double Radians(double degrees) {
  return degrees * kPi / 180.0;
}

} // namespace

double HaversineKm(const LatLng& a, const LatLng& b) {
  const double dlat = Radians(b.lat - a.lat);
  const double dlng = Radians(b.lng - a.lng);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(Radians(a.lat)) * std::cos(Radians(b.lat)) * std::sin(dlng / 2) * std::sin(dlng / 2);
  return 2 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

int EtaMinutes(double distance_km, double speed_kmh) {
  if (distance_km <= 0 || speed_kmh <= 0) {
    return 0;
  }
  return static_cast<int>(std::ceil(distance_km / speed_kmh * 60.0));
}

bool IsValid(const LatLng& point) {
  return std::isfinite(point.lat) && std::isfinite(point.lng) && point.lat >= -90 && point.lat <= 90 && point.lng >= -180 &&
         point.lng <= 180;
}

} // namespace dispatch::geo
