#include "internal/location/location_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/db/api/result_check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::location {

namespace {

struct Row {
  const db::model::WorkerLocationRecord* location;
  const db::model::WorkerRecord*         worker;
};

std::vector<NearbyWorker> Rank(const std::vector<Row>& rows, const geo::LatLng& point, double radius_km, const NearFilter& filter,
                               uint64_t since_ms) {
  std::vector<NearbyWorker> out;
  for (const auto& row : rows) {
    const auto& loc = *row.location;
    if (loc.captured_at_ms < since_ms || !loc.online || !loc.available) {
      continue;
    }
    if (row.worker == nullptr || !Matches(*row.worker, filter)) {
      continue;
    }

    const double distance = geo::HaversineKm(point, {loc.lat, loc.lng});
    if (distance > radius_km) {
      continue;
    }
    out.push_back({loc.worker_id, distance});
  }

  std::sort(out.begin(), out.end(), [](const NearbyWorker& a, const NearbyWorker& b) {
    if (a.distance_km != b.distance_km) {
      return a.distance_km < b.distance_km;
    }
    return a.worker_id < b.worker_id;
  });
  return out;
}

} // namespace

bool Matches(const db::model::WorkerRecord& worker, const NearFilter& filter) {
  if (filter.service_type != dispatch::core::v1::SERVICE_TYPE_UNSPECIFIED && !worker.Serves(filter.service_type)) {
    return false;
  }
  return filter.vehicle_type == dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED || worker.vehicle_type == filter.vehicle_type;
}

LocationRegistry::LocationRegistry(std::shared_ptr<db::Repository> repository, config::LocationSettings settings, util::NowFn now)
    : repository_(std::move(repository)), settings_(settings), now_(std::move(now)) {
}

std::optional<db::model::WorkerRecord> LocationRegistry::LookupWorker(const std::string& worker_id) {
  {
    std::shared_lock lock(mutex_);
    auto it = index_.find(worker_id);
    if (it != index_.end() && it->second.worker) {
      return it->second.worker;
    }
  }

  std::optional<db::model::WorkerRecord> worker;
  try {
    auto tx = repository_->Begin();
    worker  = repository_->GetWorker(*tx, worker_id);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::UpstreamUnavailable(std::string("worker lookup failed: ") + e.what());
  }

  if (worker) {
    std::unique_lock lock(mutex_);
    index_[worker_id].worker = worker;
  }
  return worker;
}

void LocationRegistry::Merge(const db::model::WorkerLocationRecord& location) {
  auto& entry = index_[location.worker_id];
  if (!entry.location || entry.location->captured_at_ms <= location.captured_at_ms) {
    entry.location = location;
  }
}

bool LocationRegistry::Report(db::model::WorkerLocationRecord location) {
  if (location.worker_id.empty()) {
    throw util::InvalidArgument("worker id is required");
  }
  if (!geo::IsValid({location.lat, location.lng})) {
    throw util::InvalidArgument("invalid coordinates");
  }
  if (!LookupWorker(location.worker_id)) {
    throw util::NotFound("unknown worker " + location.worker_id);
  }

  if (location.captured_at_ms == 0) {
    location.captured_at_ms = util::ToUnixMillis(now_());
  }

  {
    std::unique_lock lock(mutex_);
    Merge(location);
  }

  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->AppendWorkerLocation(*tx, location), "append worker location");
    tx->Commit();
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("worker location not persisted", {observability::StringField("worker_id", location.worker_id), observability::StringField("error", e.what())});
    return false;
  }
  return true;
}

std::vector<NearbyWorker> LocationRegistry::Near(const geo::LatLng& point, double radius_km, const NearFilter& filter) {
  const auto now_ms   = util::ToUnixMillis(now_());
  const auto window   = static_cast<uint64_t>(settings_.liveness_window.count());
  const auto since_ms = now_ms > window ? now_ms - window : 0;

  std::vector<db::model::WorkerLocationRecord> locations;
  std::vector<db::model::WorkerRecord>         workers;
  try {
    auto tx   = repository_->Begin();
    locations = repository_->LatestWorkerLocations(*tx, since_ms);
    workers   = repository_->ListWorkers(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("location store unavailable; answering from in-memory index", {observability::StringField("error", e.what())});

    std::shared_lock lock(mutex_);
    std::vector<Row> rows;
    for (const auto& [id, entry] : index_) {
      if (entry.location) {
        rows.push_back({&*entry.location, entry.worker ? &*entry.worker : nullptr});
      }
    }
    return Rank(rows, point, radius_km, filter, since_ms);
  }

  std::unordered_map<std::string, const db::model::WorkerRecord*> by_id;
  for (const auto& worker : workers) {
    by_id.emplace(worker.id, &worker);
  }

  std::vector<Row> rows;
  rows.reserve(locations.size());
  for (const auto& location : locations) {
    auto it = by_id.find(location.worker_id);
    rows.push_back({&location, it == by_id.end() ? nullptr : it->second});
  }

  {
    std::unique_lock lock(mutex_);
    for (const auto& worker : workers) {
      index_[worker.id].worker = worker;
    }
    for (const auto& location : locations) {
      Merge(location);
    }
  }

  return Rank(rows, point, radius_km, filter, since_ms);
}

std::optional<db::model::WorkerLocationRecord> LocationRegistry::Latest(const std::string& worker_id) const {
  std::shared_lock lock(mutex_);
  auto it = index_.find(worker_id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second.location;
}

void LocationRegistry::RefreshWorker(const db::model::WorkerRecord& worker) {
  std::unique_lock lock(mutex_);
  index_[worker.id].worker = worker;
}

void LocationRegistry::Hydrate() {
  auto tx        = repository_->Begin();
  auto workers   = repository_->ListWorkers(*tx);
  auto locations = repository_->LatestWorkerLocations(*tx, 0);
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& worker : workers) {
    index_[worker.id].worker = worker;
  }
  for (const auto& location : locations) {
    Merge(location);
  }
}

uint64_t LocationRegistry::Prune() {
  const auto now_ms    = util::ToUnixMillis(now_());
  const auto retention = static_cast<uint64_t>(settings_.retention.count());
  if (now_ms <= retention) {
    return 0;
  }

  uint64_t deleted = 0;
  auto     tx      = repository_->Begin();
  db::ThrowIfDbError(repository_->PruneWorkerLocations(*tx, now_ms - retention, deleted), "prune worker locations");
  tx->Commit();

  if (deleted > 0) {
    DISPATCH_LOG_INFO("pruned worker locations", {observability::IntField("deleted", static_cast<int64_t>(deleted))});
  }
  return deleted;
}

} // namespace dispatch::location
