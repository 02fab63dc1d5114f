#include "internal/matching/candidate_selector.hpp"

#include <algorithm>
#include <cmath>

#include "internal/geo/geo.hpp"
#include "internal/model/conversions.hpp"

namespace dispatch::matching {

CandidateSelector::CandidateSelector(std::shared_ptr<db::Repository> repository, std::shared_ptr<location::LocationRegistry> registry,
                                     config::DispatchSettings settings, double average_speed_kmh)
    : repository_(std::move(repository)), registry_(std::move(registry)), settings_(settings), average_speed_kmh_(average_speed_kmh) {
}

double CandidateSelector::RadiusFor(uint32_t level) const {
  const double radius = settings_.initial_radius_km * std::pow(settings_.radius_multiplier, static_cast<double>(level));
  return std::min(radius, settings_.max_radius_km);
}

uint32_t CandidateSelector::PendingCapFor(uint32_t level) const {
  return settings_.max_pending_offers_per_worker + level * settings_.pending_cap_relax_step;
}

Selection CandidateSelector::Select(const db::model::TripRecord& trip, uint32_t level) {
  Selection selection;
  selection.level       = level;
  selection.radius_km   = RadiusFor(level);
  selection.pending_cap = PendingCapFor(level);

  location::NearFilter filter;
  filter.service_type = trip.service_type;
  filter.vehicle_type = trip.vehicle_type;

  // no transaction is held while the registry reads the store
  const auto nearby = registry_->Near(model::Pickup(trip), selection.radius_km, filter);
  if (nearby.empty()) {
    return selection;
  }

  std::vector<Candidate> eligible;
  {
    auto tx = repository_->Begin();
    for (const auto& near : nearby) {
      auto worker = repository_->GetWorker(*tx, near.worker_id);
      if (!worker || !worker->eligible || !location::Matches(*worker, filter)) {
        continue;
      }
      if (repository_->ListActiveTripsForWorker(*tx, worker->id).size() >= worker->max_active_trips) {
        continue;
      }
      if (repository_->FindOffer(*tx, trip.id, worker->id)) {
        continue;
      }
      if (repository_->CountPendingOffersForWorker(*tx, worker->id, trip.id) >= selection.pending_cap) {
        continue;
      }

      eligible.push_back({worker->id, near.distance_km, geo::EtaMinutes(near.distance_km, average_speed_kmh_)});
    }
    tx->Commit();
  }

  const std::size_t batch_size = std::max<uint32_t>(settings_.batch_size, 1);
  for (std::size_t i = 0; i < eligible.size(); i += batch_size) {
    const auto end = std::min(eligible.size(), i + batch_size);
    selection.batches.emplace_back(eligible.begin() + static_cast<std::ptrdiff_t>(i), eligible.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return selection;
}

} // namespace dispatch::matching
