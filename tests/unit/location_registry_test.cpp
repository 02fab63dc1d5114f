#include "internal/location/location_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::location::LocationRegistry;
using dispatch::location::NearFilter;
using dispatch::testing::Harness;
using dispatch::testing::kPickup;
using dispatch::testing::North;
using dispatch::testing::Throws;

namespace db = dispatch::db;

// Forwards to a real repository until the store is switched off; from
// then on every unit of work fails at Begin().
class SwitchableStore final : public db::Repository {
 public:
  explicit SwitchableStore(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void SetAvailable(bool available) {
    available_ = available;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (!available_) {
      throw dispatch::util::UpstreamUnavailable("store is down");
    }
    return inner_->Begin();
  }

  db::Result InsertTrip(db::Transaction& t, const db::model::TripRecord& r) override {
    return inner_->InsertTrip(t, r);
  }
  std::optional<db::model::TripRecord> GetTrip(db::Transaction& t, const std::string& id) override {
    return inner_->GetTrip(t, id);
  }
  db::Result UpdateTrip(db::Transaction& t, const db::model::TripRecord& r, uint64_t v) override {
    return inner_->UpdateTrip(t, r, v);
  }
  db::Result BindWorker(db::Transaction& t, const std::string& trip_id, const std::string& worker_id) override {
    return inner_->BindWorker(t, trip_id, worker_id);
  }
  db::Result ReleaseWorker(db::Transaction& t, const std::string& trip_id, const std::string& worker_id) override {
    return inner_->ReleaseWorker(t, trip_id, worker_id);
  }
  std::vector<db::model::TripRecord> ListActiveTripsForRequester(db::Transaction& t, const std::string& id) override {
    return inner_->ListActiveTripsForRequester(t, id);
  }
  std::vector<db::model::TripRecord> ListActiveTripsForWorker(db::Transaction& t, const std::string& id) override {
    return inner_->ListActiveTripsForWorker(t, id);
  }
  std::vector<db::model::TripRecord> ListTripsByStatus(db::Transaction& t, TripStatus status) override {
    return inner_->ListTripsByStatus(t, status);
  }
  std::vector<db::model::TripRecord> ListDueScheduledTrips(db::Transaction& t, uint64_t now_ms) override {
    return inner_->ListDueScheduledTrips(t, now_ms);
  }
  db::Result AppendStatusChange(db::Transaction& t, const db::model::StatusChangeRecord& r) override {
    return inner_->AppendStatusChange(t, r);
  }
  std::vector<db::model::StatusChangeRecord> ListStatusChanges(db::Transaction& t, const std::string& trip_id) override {
    return inner_->ListStatusChanges(t, trip_id);
  }
  db::Result InsertOffer(db::Transaction& t, const db::model::OfferRecord& r) override {
    return inner_->InsertOffer(t, r);
  }
  std::optional<db::model::OfferRecord> GetOffer(db::Transaction& t, const std::string& id) override {
    return inner_->GetOffer(t, id);
  }
  std::optional<db::model::OfferRecord> FindOffer(db::Transaction& t, const std::string& trip_id, const std::string& worker_id) override {
    return inner_->FindOffer(t, trip_id, worker_id);
  }
  std::vector<db::model::OfferRecord> ListOffersForTrip(db::Transaction& t, const std::string& trip_id) override {
    return inner_->ListOffersForTrip(t, trip_id);
  }
  std::vector<db::model::OfferRecord> ListPendingOffersForWorker(db::Transaction& t, const std::string& worker_id) override {
    return inner_->ListPendingOffersForWorker(t, worker_id);
  }
  uint32_t CountPendingOffersForWorker(db::Transaction& t, const std::string& worker_id, const std::string& exclude_trip_id) override {
    return inner_->CountPendingOffersForWorker(t, worker_id, exclude_trip_id);
  }
  std::vector<db::model::OfferRecord> ListExpiredPendingOffers(db::Transaction& t, uint64_t now_ms) override {
    return inner_->ListExpiredPendingOffers(t, now_ms);
  }
  db::Result ResolveOffer(db::Transaction& t, const std::string& offer_id, OfferStatus expected, OfferStatus to, uint64_t at_ms,
                          const std::string& reason) override {
    return inner_->ResolveOffer(t, offer_id, expected, to, at_ms, reason);
  }
  db::Result ResolvePendingOffers(db::Transaction& t, const db::PendingOfferFilter& filter, OfferStatus to, uint64_t at_ms,
                                  const std::string& reason, std::vector<db::model::OfferRecord>& resolved) override {
    return inner_->ResolvePendingOffers(t, filter, to, at_ms, reason, resolved);
  }
  db::Result LockAccount(db::Transaction& t, const std::string& account_id) override {
    return inner_->LockAccount(t, account_id);
  }
  db::Result InsertLedgerEntry(db::Transaction& t, const db::model::LedgerEntryRecord& r) override {
    return inner_->InsertLedgerEntry(t, r);
  }
  std::optional<db::model::LedgerEntryRecord> GetLedgerEntry(db::Transaction& t, const std::string& id) override {
    return inner_->GetLedgerEntry(t, id);
  }
  std::vector<db::model::LedgerEntryRecord> ListLedgerEntries(db::Transaction& t, const std::string& account_id) override {
    return inner_->ListLedgerEntries(t, account_id);
  }
  std::vector<db::model::LedgerEntryRecord> ListLedgerEntriesForTrip(db::Transaction& t, const std::string& trip_id) override {
    return inner_->ListLedgerEntriesForTrip(t, trip_id);
  }
  std::optional<db::model::LedgerEntryRecord> FindSettlement(db::Transaction& t, const std::string& hold_id) override {
    return inner_->FindSettlement(t, hold_id);
  }
  int64_t AvailableBalance(db::Transaction& t, const std::string& account_id) override {
    return inner_->AvailableBalance(t, account_id);
  }
  db::Result UpsertWorker(db::Transaction& t, const db::model::WorkerRecord& r) override {
    return inner_->UpsertWorker(t, r);
  }
  std::optional<db::model::WorkerRecord> GetWorker(db::Transaction& t, const std::string& id) override {
    return inner_->GetWorker(t, id);
  }
  std::vector<db::model::WorkerRecord> ListWorkers(db::Transaction& t) override {
    return inner_->ListWorkers(t);
  }
  db::RatingSummary SummarizeWorkerRatings(db::Transaction& t, const std::string& worker_id) override {
    return inner_->SummarizeWorkerRatings(t, worker_id);
  }
  db::Result SetWorkerRating(db::Transaction& t, const std::string& worker_id, const db::RatingSummary& summary) override {
    return inner_->SetWorkerRating(t, worker_id, summary);
  }
  db::Result AppendWorkerLocation(db::Transaction& t, const db::model::WorkerLocationRecord& r) override {
    return inner_->AppendWorkerLocation(t, r);
  }
  std::vector<db::model::WorkerLocationRecord> LatestWorkerLocations(db::Transaction& t, uint64_t since_ms) override {
    return inner_->LatestWorkerLocations(t, since_ms);
  }
  std::optional<db::model::WorkerLocationRecord> LatestWorkerLocation(db::Transaction& t, const std::string& worker_id) override {
    return inner_->LatestWorkerLocation(t, worker_id);
  }
  db::Result PruneWorkerLocations(db::Transaction& t, uint64_t older_than_ms, uint64_t& deleted) override {
    return inner_->PruneWorkerLocations(t, older_than_ms, deleted);
  }
  db::Result InsertShareToken(db::Transaction& t, const db::model::ShareTokenRecord& r) override {
    return inner_->InsertShareToken(t, r);
  }
  std::optional<db::model::ShareTokenRecord> GetShareToken(db::Transaction& t, const std::string& token) override {
    return inner_->GetShareToken(t, token);
  }
  std::optional<db::model::ShareTokenRecord> FindActiveShareToken(db::Transaction& t, const std::string& trip_id, uint64_t now_ms) override {
    return inner_->FindActiveShareToken(t, trip_id, now_ms);
  }
  db::Result RevokeShareTokens(db::Transaction& t, const std::string& trip_id, uint64_t at_ms, uint32_t& revoked) override {
    return inner_->RevokeShareTokens(t, trip_id, at_ms, revoked);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  std::atomic<bool>               available_{true};
};

NearFilter Standard(VehicleType vehicle = VEHICLE_TYPE_UNSPECIFIED) {
  NearFilter filter;
  filter.service_type = SERVICE_TYPE_STANDARD;
  filter.vehicle_type = vehicle;
  return filter;
}

void TestNearRanksByDistance() {
  Harness h;
  h.AddWorker("driver-far", North(kPickup, 3.0));
  h.AddWorker("driver-near", North(kPickup, 0.5));
  h.AddWorker("driver-mid", North(kPickup, 1.5));
  h.AddWorker("driver-out", North(kPickup, 9.0));

  auto near = h.registry->Near(kPickup, 5.0, Standard());
  assert(near.size() == 3);
  assert(near[0].worker_id == "driver-near");
  assert(near[1].worker_id == "driver-mid");
  assert(near[2].worker_id == "driver-far");
  assert(near[0].distance_km > 0.49 && near[0].distance_km < 0.51);
}

void TestNearBreaksTiesById() {
  Harness h;
  h.AddWorker("driver-b", North(kPickup, 1.0));
  h.AddWorker("driver-a", North(kPickup, 1.0));

  auto near = h.registry->Near(kPickup, 5.0, Standard());
  assert(near.size() == 2);
  assert(near[0].worker_id == "driver-a");
}

void TestNearFiltersCapabilities() {
  Harness h;
  h.AddWorker("driver-car", North(kPickup, 1.0), SERVICE_TYPE_STANDARD, VEHICLE_TYPE_CAR);
  h.AddWorker("driver-bike", North(kPickup, 1.0), SERVICE_TYPE_STANDARD, VEHICLE_TYPE_BICYCLE);
  h.AddWorker("courier", North(kPickup, 1.0), SERVICE_TYPE_DELIVERY, VEHICLE_TYPE_MOTORCYCLE);

  assert(h.registry->Near(kPickup, 5.0, Standard()).size() == 2);

  auto cars = h.registry->Near(kPickup, 5.0, Standard(VEHICLE_TYPE_CAR));
  assert(cars.size() == 1 && cars[0].worker_id == "driver-car");

  NearFilter delivery;
  delivery.service_type = SERVICE_TYPE_DELIVERY;
  auto couriers         = h.registry->Near(kPickup, 5.0, delivery);
  assert(couriers.size() == 1 && couriers[0].worker_id == "courier");
}

void TestNearSkipsStaleOfflineAndBusy() {
  Harness h;
  h.AddWorker("driver-stale", North(kPickup, 1.0));

  h.clock.Advance(std::chrono::minutes(6));
  h.AddWorker("driver-fresh", North(kPickup, 1.0));
  h.AddWorker("driver-busy", North(kPickup, 1.0));
  h.MoveWorker("driver-busy", North(kPickup, 1.0), false);

  dispatch::db::model::WorkerLocationRecord offline;
  offline.worker_id = "driver-fresh";
  offline.lat       = North(kPickup, 1.0).lat;
  offline.lng       = kPickup.lng;
  offline.online    = false;

  auto near = h.registry->Near(kPickup, 5.0, Standard());
  assert(near.size() == 1 && near[0].worker_id == "driver-fresh");

  h.registry->Report(offline);
  assert(h.registry->Near(kPickup, 5.0, Standard()).empty());
}

void TestReportValidation() {
  Harness h;
  dispatch::db::model::WorkerLocationRecord location;
  location.lat = 1;
  location.lng = 1;
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.registry->Report(location); }));

  location.worker_id = "ghost";
  assert(Throws<dispatch::util::NotFound>([&] { h.registry->Report(location); }));

  h.AddWorker("driver-1", kPickup);
  location.worker_id = "driver-1";
  location.lat       = 120;
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.registry->Report(location); }));
}

void TestReportStampsAndPersists() {
  Harness h;
  h.AddWorker("driver-1", kPickup);

  h.clock.Advance(std::chrono::seconds(30));
  dispatch::db::model::WorkerLocationRecord location;
  location.worker_id = "driver-1";
  location.lat       = 37.78;
  location.lng       = -122.41;
  location.heading   = 90;
  location.online    = true;
  location.available = true;
  assert(h.registry->Report(location));

  auto latest = h.registry->Latest("driver-1");
  assert(latest && latest->captured_at_ms == h.clock.NowMs());
  assert(latest->heading == 90);

  auto tx     = h.repository->Begin();
  auto stored = h.repository->LatestWorkerLocation(*tx, "driver-1");
  tx->Commit();
  assert(stored && stored->lat == 37.78);
}

void TestOutOfOrderReportDoesNotRewindIndex() {
  Harness h;
  h.AddWorker("driver-1", kPickup);
  const auto first_ms = h.clock.NowMs();

  h.clock.Advance(std::chrono::seconds(10));
  h.MoveWorker("driver-1", North(kPickup, 2.0));

  dispatch::db::model::WorkerLocationRecord late;
  late.worker_id      = "driver-1";
  late.lat            = 0;
  late.lng            = 0;
  late.online         = true;
  late.captured_at_ms = first_ms + 1;
  h.registry->Report(late);

  auto latest = h.registry->Latest("driver-1");
  assert(latest && latest->captured_at_ms == h.clock.NowMs());
}

void TestRefreshWorkerChangesEligibility() {
  Harness h;
  auto worker = h.AddWorker("driver-1", North(kPickup, 1.0));
  assert(h.registry->Near(kPickup, 5.0, Standard()).size() == 1);

  // the store is the answer when it is reachable
  worker.service_mask = 1u << SERVICE_TYPE_PREMIUM;
  auto tx             = h.repository->Begin();
  assert(h.repository->UpsertWorker(*tx, worker));
  tx->Commit();
  h.registry->RefreshWorker(worker);

  assert(h.registry->Near(kPickup, 5.0, Standard()).empty());
}

void TestHydrateLoadsLatestPositions() {
  Harness h;
  h.AddWorker("driver-1", North(kPickup, 1.0));
  h.clock.Advance(std::chrono::seconds(5));
  h.MoveWorker("driver-1", North(kPickup, 2.0));

  LocationRegistry fresh(h.repository, h.settings.location, h.clock.Fn());
  assert(!fresh.Latest("driver-1"));
  fresh.Hydrate();

  auto latest = fresh.Latest("driver-1");
  assert(latest && latest->captured_at_ms == h.clock.NowMs());
}

void TestPruneKeepsLatestPerWorker() {
  Harness h;
  h.AddWorker("driver-1", kPickup);
  h.clock.Advance(std::chrono::hours(1));
  h.MoveWorker("driver-1", North(kPickup, 1.0));

  // nothing is past retention yet
  assert(h.registry->Prune() == 0);

  h.clock.Advance(std::chrono::hours(24) + std::chrono::minutes(30));
  assert(h.registry->Prune() == 1);

  auto tx     = h.repository->Begin();
  auto latest = h.repository->LatestWorkerLocation(*tx, "driver-1");
  tx->Commit();
  assert(latest.has_value());
  assert(h.registry->Latest("driver-1").has_value());
}

void TestNearAnswersFromIndexWhenStoreIsDown() {
  Harness h;
  h.AddWorker("driver-1", North(kPickup, 1.0));
  h.AddWorker("driver-far", North(kPickup, 9.0));

  auto             store = std::make_shared<SwitchableStore>(h.repository);
  LocationRegistry registry(store, h.settings.location, h.clock.Fn());
  registry.Hydrate();

  auto up = registry.Near(kPickup, 5.0, Standard());
  assert(up.size() == 1);
  assert(up[0].worker_id == "driver-1");

  store->SetAvailable(false);
  auto down = registry.Near(kPickup, 5.0, Standard());
  assert(down.size() == 1);
  assert(down[0].worker_id == "driver-1");
  assert(down[0].distance_km > 0.99 && down[0].distance_km < 1.01);

  // a report that cannot be persisted still moves the worker in the index
  dispatch::db::model::WorkerLocationRecord moved;
  moved.worker_id = "driver-1";
  moved.lat       = North(kPickup, 2.0).lat;
  moved.lng       = North(kPickup, 2.0).lng;
  moved.online    = true;
  moved.available = true;
  assert(!registry.Report(moved));

  down = registry.Near(kPickup, 5.0, Standard());
  assert(down.size() == 1);
  assert(down[0].distance_km > 1.99 && down[0].distance_km < 2.01);

  // liveness still applies to the index
  h.clock.Advance(h.settings.location.liveness_window + std::chrono::seconds(1));
  assert(registry.Near(kPickup, 5.0, Standard()).empty());

  store->SetAvailable(true);
  assert(registry.Near(kPickup, 5.0, Standard()).empty());
}

} // namespace

int main() {
  TestNearRanksByDistance();
  TestNearBreaksTiesById();
  TestNearFiltersCapabilities();
  TestNearSkipsStaleOfflineAndBusy();
  TestReportValidation();
  TestReportStampsAndPersists();
  TestOutOfOrderReportDoesNotRewindIndex();
  TestRefreshWorkerChangesEligibility();
  TestHydrateLoadsLatestPositions();
  TestPruneKeepsLatestPerWorker();
  TestNearAnswersFromIndexWhenStoreIsDown();

  std::cout << "dispatch_unit_location_registry: pass\n";
  return 0;
}
