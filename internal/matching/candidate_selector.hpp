#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/location/location_registry.hpp"

namespace dispatch::matching {

struct Candidate {
  std::string worker_id;
  double      distance_km = 0;
  int32_t     eta_minutes = 0;
};

struct Selection {
  uint32_t level       = 0;
  double   radius_km   = 0;
  uint32_t pending_cap = 0;

  // closest first, batch_size each
  std::vector<std::vector<Candidate>> batches;
};

/*
  Ranks eligible workers for one trip at one escalation level.

  Level n searches radius initial * multiplier^n (capped) and lets a
  worker hold max_pending + n * relax_step open offers on other trips.
  Workers already offered this trip are never selected again.
*/
class CandidateSelector {
 public:
  CandidateSelector(std::shared_ptr<db::Repository> repository, std::shared_ptr<location::LocationRegistry> registry,
                    config::DispatchSettings settings, double average_speed_kmh);

  Selection Select(const db::model::TripRecord& trip, uint32_t level);

  double   RadiusFor(uint32_t level) const;
  uint32_t PendingCapFor(uint32_t level) const;

 private:
  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<location::LocationRegistry> registry_;
  config::DispatchSettings                    settings_;
  double                                      average_speed_kmh_;
};

} // namespace dispatch::matching
