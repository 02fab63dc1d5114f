#pragma once

namespace dispatch::geo {

struct LatLng {
  double lat = 0;
  double lng = 0;
};

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance.
double HaversineKm(const LatLng& a, const LatLng& b);

// Whole minutes to cover distance_km at speed_kmh, rounded up.
int EtaMinutes(double distance_km, double speed_kmh);

bool IsValid(const LatLng& point);

} // namespace dispatch::geo
