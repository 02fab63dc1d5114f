#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/geo/geo.hpp"
#include "internal/util/time.hpp"

namespace dispatch::location {

struct NearFilter {
  dispatch::core::v1::ServiceType service_type = dispatch::core::v1::SERVICE_TYPE_UNSPECIFIED;
  // VEHICLE_TYPE_UNSPECIFIED accepts any vehicle
  dispatch::core::v1::VehicleType vehicle_type = dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED;
};

struct NearbyWorker {
  std::string worker_id;
  double      distance_km = 0;
};

/*
  Worker positions and availability.

  The store holds the append-only history; the in-memory index holds
  each worker's latest report plus its capability flags so Near can
  still answer (stale) when the store is unreachable.
*/
class LocationRegistry {
 public:
  LocationRegistry(std::shared_ptr<db::Repository> repository, config::LocationSettings settings, util::NowFn now = util::Now);

  // Updates the index, then appends the row. Returns false when the
  // append failed; the index still carries the report.
  // NotFound for a worker the store has never seen.
  bool Report(db::model::WorkerLocationRecord location);

  // Live (reported within the liveness window), online and available
  // workers within radius_km of point that match filter, closest first.
  std::vector<NearbyWorker> Near(const geo::LatLng& point, double radius_km, const NearFilter& filter);

  std::optional<db::model::WorkerLocationRecord> Latest(const std::string& worker_id) const;

  // Capability flags changed through the admin surface.
  void RefreshWorker(const db::model::WorkerRecord& worker);

  // Loads workers and latest positions; used at startup.
  void Hydrate();

  // Deletes history older than the retention window. Returns rows removed.
  uint64_t Prune();

 private:
  struct Entry {
    std::optional<db::model::WorkerRecord>         worker;
    std::optional<db::model::WorkerLocationRecord> location;
  };

  std::optional<db::model::WorkerRecord> LookupWorker(const std::string& worker_id);

  void Merge(const db::model::WorkerLocationRecord& location);

  std::shared_ptr<db::Repository> repository_;
  config::LocationSettings        settings_;
  util::NowFn                     now_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> index_;
};

// Service and vehicle match for one worker.
bool Matches(const db::model::WorkerRecord& worker, const NearFilter& filter);

} // namespace dispatch::location
