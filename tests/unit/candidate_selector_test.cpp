#include "internal/matching/candidate_selector.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/geo/geo.hpp"
#include "internal/util/uuid.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::matching::CandidateSelector;
using dispatch::testing::FastSettings;
using dispatch::testing::Harness;
using dispatch::testing::kPickup;
using dispatch::testing::North;

void Offer(Harness& h, const std::string& trip_id, const std::string& worker_id) {
  dispatch::db::model::OfferRecord offer;
  offer.id            = dispatch::util::NewId();
  offer.trip_id       = trip_id;
  offer.worker_id     = worker_id;
  offer.status        = OFFER_STATUS_PENDING;
  offer.batch_number  = 1;
  offer.sent_at_ms    = h.clock.NowMs();
  offer.expires_at_ms = h.clock.NowMs() + 20000;

  auto tx = h.repository->Begin();
  dispatch::db::ThrowIfDbError(h.repository->InsertOffer(*tx, offer), "insert offer");
  tx->Commit();
}

void TestRadiusAndCapGrowWithLevel() {
  Harness h;
  assert(h.selector->RadiusFor(0) == 5.0);
  assert(h.selector->RadiusFor(1) == 7.5);
  assert(h.selector->RadiusFor(2) == 11.25);
  // 16.875 capped
  assert(h.selector->RadiusFor(3) == 15.0);
  assert(h.selector->RadiusFor(10) == 15.0);

  assert(h.selector->PendingCapFor(0) == 1);
  assert(h.selector->PendingCapFor(2) == 3);
}

void TestClosestFirstWithEta() {
  Harness h;
  h.AddWorker("driver-2km", North(kPickup, 2.0));
  h.AddWorker("driver-1km", North(kPickup, 1.0));
  auto trip = h.SearchingTrip("rider-1");

  auto selection = h.selector->Select(trip, 0);
  assert(selection.level == 0);
  assert(selection.radius_km == 5.0);
  assert(selection.batches.size() == 1);

  const auto& batch = selection.batches[0];
  assert(batch.size() == 2);
  assert(batch[0].worker_id == "driver-1km");
  assert(batch[1].worker_id == "driver-2km");
  assert(std::fabs(batch[0].distance_km - 1.0) < 0.01);
  assert(batch[0].eta_minutes == dispatch::geo::EtaMinutes(batch[0].distance_km, 30.0));
  assert(batch[1].eta_minutes >= 4);
}

void TestWiderRadiusAtHigherLevel() {
  Harness h;
  h.AddWorker("driver-6km", North(kPickup, 6.0));
  auto trip = h.SearchingTrip("rider-1");

  assert(h.selector->Select(trip, 0).batches.empty());

  auto wider = h.selector->Select(trip, 1);
  assert(wider.batches.size() == 1);
  assert(wider.batches[0][0].worker_id == "driver-6km");
}

void TestSplitsIntoBatches() {
  auto settings                = FastSettings();
  settings.dispatch.batch_size = 2;
  Harness h(settings);
  for (int i = 1; i <= 5; ++i) {
    h.AddWorker("driver-" + std::to_string(i), North(kPickup, 0.5 * i));
  }
  auto trip = h.SearchingTrip("rider-1");

  auto selection = h.selector->Select(trip, 0);
  assert(selection.batches.size() == 3);
  assert(selection.batches[0].size() == 2);
  assert(selection.batches[1].size() == 2);
  assert(selection.batches[2].size() == 1);
  assert(selection.batches[0][0].worker_id == "driver-1");
  assert(selection.batches[2][0].worker_id == "driver-5");
}

void TestSkipsWorkersAlreadyOffered() {
  Harness h;
  h.AddWorker("driver-a", North(kPickup, 1.0));
  h.AddWorker("driver-b", North(kPickup, 2.0));
  auto trip = h.SearchingTrip("rider-1");
  Offer(h, trip.id, "driver-a");

  auto selection = h.selector->Select(trip, 0);
  assert(selection.batches.size() == 1);
  assert(selection.batches[0].size() == 1);
  assert(selection.batches[0][0].worker_id == "driver-b");
}

void TestPendingCapRelaxesWithLevel() {
  Harness h;
  h.AddWorker("driver-a", North(kPickup, 1.0));
  auto other = h.SearchingTrip("rider-other");
  auto trip  = h.SearchingTrip("rider-1");
  Offer(h, other.id, "driver-a");

  // one open offer elsewhere fills the level 0 cap
  assert(h.selector->Select(trip, 0).batches.empty());
  assert(h.selector->Select(trip, 1).batches.size() == 1);
}

void TestSkipsWorkersAtCapacity() {
  Harness h;
  h.AddWorker("driver-a", North(kPickup, 1.0));
  h.AddWorker("driver-b", North(kPickup, 1.5), SERVICE_TYPE_STANDARD, VEHICLE_TYPE_CAR, 2);

  auto busy_a = h.SearchingTrip("rider-x");
  auto busy_b = h.SearchingTrip("rider-y");
  {
    auto tx = h.repository->Begin();
    dispatch::db::ThrowIfDbError(h.repository->BindWorker(*tx, busy_a.id, "driver-a"), "bind");
    dispatch::db::ThrowIfDbError(h.repository->BindWorker(*tx, busy_b.id, "driver-b"), "bind");
    tx->Commit();
  }

  auto trip      = h.SearchingTrip("rider-1");
  auto selection = h.selector->Select(trip, 0);
  assert(selection.batches.size() == 1);
  assert(selection.batches[0].size() == 1);
  assert(selection.batches[0][0].worker_id == "driver-b");
}

void TestSkipsIneligibleAndMismatchedWorkers() {
  Harness h;
  auto suspended     = h.AddWorker("driver-suspended", North(kPickup, 1.0));
  h.AddWorker("driver-premium", North(kPickup, 1.0), SERVICE_TYPE_PREMIUM);
  h.AddWorker("driver-ok", North(kPickup, 3.0));

  suspended.eligible = false;
  {
    auto tx = h.repository->Begin();
    dispatch::db::ThrowIfDbError(h.repository->UpsertWorker(*tx, suspended), "upsert worker");
    tx->Commit();
  }
  h.registry->RefreshWorker(suspended);

  auto trip      = h.SearchingTrip("rider-1");
  auto selection = h.selector->Select(trip, 0);
  assert(selection.batches.size() == 1);
  assert(selection.batches[0].size() == 1);
  assert(selection.batches[0][0].worker_id == "driver-ok");

  auto premium_trip = h.SearchingTrip("rider-2", PAYMENT_METHOD_CASH, SERVICE_TYPE_PREMIUM);
  auto premium      = h.selector->Select(premium_trip, 0);
  assert(premium.batches.size() == 1);
  assert(premium.batches[0][0].worker_id == "driver-premium");
}

} // namespace

int main() {
  TestRadiusAndCapGrowWithLevel();
  TestClosestFirstWithEta();
  TestWiderRadiusAtHigherLevel();
  TestSplitsIntoBatches();
  TestSkipsWorkersAlreadyOffered();
  TestPendingCapRelaxesWithLevel();
  TestSkipsWorkersAtCapacity();
  TestSkipsIneligibleAndMismatchedWorkers();

  std::cout << "dispatch_unit_candidate_selector: pass\n";
  return 0;
}
