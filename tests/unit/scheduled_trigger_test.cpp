#include "internal/schedule/scheduled_trigger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_OFFER_CREATED;
using dispatch::events::v1::EVENT_TYPE_TRIP_CANCELLED;
using dispatch::events::v1::EVENT_TYPE_TRIP_STATUS_CHANGED;
using dispatch::testing::Harness;
using dispatch::testing::kDropoff;
using dispatch::testing::kPickup;
using dispatch::testing::North;

constexpr auto kHour = std::chrono::hours(1);

dispatch::db::model::TripRecord Scheduled(Harness& h, const std::string& requester, std::chrono::milliseconds ahead) {
  dispatch::payment::TripDraft draft;
  draft.requester_id    = requester;
  draft.pickup          = kPickup;
  draft.dropoff         = kDropoff;
  draft.service_type    = SERVICE_TYPE_STANDARD;
  draft.payment_method  = PAYMENT_METHOD_WALLET;
  draft.estimated_fare  = 500;
  draft.currency        = "USD";
  draft.scheduled_at_ms = h.clock.NowMs() + static_cast<uint64_t>(ahead.count());

  auto trip = h.holds->CreateTripWithHold(draft).trip;
  assert(trip.status == TRIP_STATUS_SCHEDULED);
  return trip;
}

void TestNothingDueYet() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto trip = Scheduled(h, "rider-1", kHour);

  h.clock.Advance(std::chrono::minutes(59));
  auto summary = h.trigger->RunOnce();
  assert(summary.due == 0);
  assert(h.Trip(trip.id).status == TRIP_STATUS_SCHEDULED);
}

void TestDueTripIsPromotedAndDispatched() {
  Harness h;
  h.Credit("rider-1", 1000);
  h.AddWorker("driver-a", North(kPickup, 1.0));
  auto rider  = h.Listen("rider-1", USER_ROLE_REQUESTER);
  auto driver = h.Listen("driver-a", USER_ROLE_WORKER);
  auto trip   = Scheduled(h, "rider-1", kHour);

  h.clock.Advance(kHour);
  // an hour-old report is past the liveness window
  h.MoveWorker("driver-a", North(kPickup, 1.0));

  auto summary = h.trigger->RunOnce();
  assert(summary.due == 1);
  assert(summary.promoted == 1);
  assert(summary.cancelled == 0 && summary.failed == 0);

  auto stored = h.Trip(trip.id);
  assert(stored.status == TRIP_STATUS_SEARCHING);
  assert(stored.searching_at_ms == h.clock.NowMs());
  assert(stored.dispatch_batch == 1);
  assert(rider->Count(EVENT_TYPE_TRIP_STATUS_CHANGED) == 1);
  assert(driver->Count(EVENT_TYPE_OFFER_CREATED) == 1);

  auto history = h.History(trip.id);
  assert(history.back().from_status == TRIP_STATUS_SCHEDULED);
  assert(history.back().to_status == TRIP_STATUS_SEARCHING);
  assert(history.back().actor_id == "system");

  // promoted once
  assert(h.trigger->RunOnce().due == 0);
}

void TestConflictWithActiveTripCancels() {
  Harness h;
  h.Credit("rider-1", 2000);
  auto rider     = h.Listen("rider-1", USER_ROLE_REQUESTER);
  auto scheduled = Scheduled(h, "rider-1", kHour);
  auto current   = h.SearchingTrip("rider-1", PAYMENT_METHOD_WALLET);
  assert(h.Balance("rider-1") == 1000);

  h.clock.Advance(kHour);
  auto summary = h.trigger->RunOnce();
  assert(summary.due == 1);
  assert(summary.cancelled == 1);
  assert(summary.promoted == 0);

  auto stored = h.Trip(scheduled.id);
  assert(stored.status == TRIP_STATUS_CANCELLED);
  assert(stored.cancellation_reason == CANCELLATION_REASON_SCHEDULE_CONFLICT);
  assert(h.Balance("rider-1") == 1500);
  assert(h.Trip(current.id).status == TRIP_STATUS_SEARCHING);

  assert(rider->Count(EVENT_TYPE_TRIP_CANCELLED) == 1);
  assert(rider->Events().back().reason() == "schedule_conflict");
}

void TestPromotedWithoutWorkersEndsInNoMatch() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto trip = Scheduled(h, "rider-1", kHour);

  h.clock.Advance(kHour + std::chrono::minutes(5));
  auto summary = h.trigger->RunOnce();
  assert(summary.promoted == 1);

  auto stored = h.Trip(trip.id);
  assert(stored.status == TRIP_STATUS_CANCELLED);
  assert(stored.cancellation_reason == CANCELLATION_REASON_NO_MATCH);
  assert(h.Balance("rider-1") == 1000);
}

void TestSeveralDueInOneRun() {
  Harness h;
  h.Credit("rider-1", 1000);
  h.Credit("rider-2", 1000);
  h.Credit("rider-3", 1000);
  auto first  = Scheduled(h, "rider-1", std::chrono::minutes(30));
  auto second = Scheduled(h, "rider-2", std::chrono::minutes(45));
  auto later  = Scheduled(h, "rider-3", std::chrono::hours(3));

  h.clock.Advance(kHour);
  auto summary = h.trigger->RunOnce();
  assert(summary.due == 2);
  assert(summary.promoted == 2);
  assert(h.Trip(first.id).status != TRIP_STATUS_SCHEDULED);
  assert(h.Trip(second.id).status != TRIP_STATUS_SCHEDULED);
  assert(h.Trip(later.id).status == TRIP_STATUS_SCHEDULED);
}

} // namespace

int main() {
  TestNothingDueYet();
  TestDueTripIsPromotedAndDispatched();
  TestConflictWithActiveTripCancels();
  TestPromotedWithoutWorkersEndsInNoMatch();
  TestSeveralDueInOneRun();

  std::cout << "dispatch_unit_scheduled_trigger: pass\n";
  return 0;
}
