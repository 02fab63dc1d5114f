#include "internal/model/trip_state_machine.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::model::CanTransition;
using dispatch::model::IsActive;
using dispatch::model::IsTerminal;
using dispatch::testing::ManualClock;
using dispatch::testing::Throws;

const std::vector<TripStatus> kAll = {TRIP_STATUS_PENDING,        TRIP_STATUS_SCHEDULED,   TRIP_STATUS_SEARCHING,
                                      TRIP_STATUS_ASSIGNED,       TRIP_STATUS_ARRIVED_PICKUP, TRIP_STATUS_IN_PROGRESS,
                                      TRIP_STATUS_ARRIVED_DROPOFF, TRIP_STATUS_COMPLETED,  TRIP_STATUS_CANCELLED};

void TestHappyPathIsAllowed() {
  assert(CanTransition(TRIP_STATUS_PENDING, TRIP_STATUS_SEARCHING));
  assert(CanTransition(TRIP_STATUS_PENDING, TRIP_STATUS_SCHEDULED));
  assert(CanTransition(TRIP_STATUS_SCHEDULED, TRIP_STATUS_SEARCHING));
  assert(CanTransition(TRIP_STATUS_SEARCHING, TRIP_STATUS_ASSIGNED));
  assert(CanTransition(TRIP_STATUS_ASSIGNED, TRIP_STATUS_ARRIVED_PICKUP));
  assert(CanTransition(TRIP_STATUS_ARRIVED_PICKUP, TRIP_STATUS_IN_PROGRESS));
  assert(CanTransition(TRIP_STATUS_IN_PROGRESS, TRIP_STATUS_ARRIVED_DROPOFF));
  assert(CanTransition(TRIP_STATUS_ARRIVED_DROPOFF, TRIP_STATUS_COMPLETED));
}

void TestSkipsAreRejected() {
  assert(!CanTransition(TRIP_STATUS_SEARCHING, TRIP_STATUS_COMPLETED));
  assert(!CanTransition(TRIP_STATUS_SEARCHING, TRIP_STATUS_IN_PROGRESS));
  assert(!CanTransition(TRIP_STATUS_ASSIGNED, TRIP_STATUS_IN_PROGRESS));
  assert(!CanTransition(TRIP_STATUS_IN_PROGRESS, TRIP_STATUS_COMPLETED));
  assert(!CanTransition(TRIP_STATUS_SCHEDULED, TRIP_STATUS_ASSIGNED));
  assert(!CanTransition(TRIP_STATUS_PENDING, TRIP_STATUS_ASSIGNED));
}

void TestCancelReachableFromEveryNonTerminalState() {
  for (auto from : kAll) {
    assert(CanTransition(from, TRIP_STATUS_CANCELLED) == !IsTerminal(from));
  }
}

void TestTerminalStatesAreFinal() {
  for (auto to : kAll) {
    assert(!CanTransition(TRIP_STATUS_COMPLETED, to));
    assert(!CanTransition(TRIP_STATUS_CANCELLED, to));
  }
}

void TestReassignmentOnlyBeforePickup() {
  assert(CanTransition(TRIP_STATUS_ASSIGNED, TRIP_STATUS_SEARCHING));
  assert(CanTransition(TRIP_STATUS_ARRIVED_PICKUP, TRIP_STATUS_SEARCHING));
  assert(!CanTransition(TRIP_STATUS_IN_PROGRESS, TRIP_STATUS_SEARCHING));
  assert(!CanTransition(TRIP_STATUS_ARRIVED_DROPOFF, TRIP_STATUS_SEARCHING));
}

void TestActiveSet() {
  assert(!IsActive(TRIP_STATUS_PENDING));
  assert(!IsActive(TRIP_STATUS_SCHEDULED));
  assert(IsActive(TRIP_STATUS_SEARCHING));
  assert(IsActive(TRIP_STATUS_ASSIGNED));
  assert(IsActive(TRIP_STATUS_ARRIVED_PICKUP));
  assert(IsActive(TRIP_STATUS_IN_PROGRESS));
  assert(IsActive(TRIP_STATUS_ARRIVED_DROPOFF));
  assert(!IsActive(TRIP_STATUS_COMPLETED));
  assert(!IsActive(TRIP_STATUS_CANCELLED));
}

dispatch::db::model::TripRecord InsertPending(dispatch::db::Repository& repo, const std::string& id, const std::string& requester) {
  dispatch::db::model::TripRecord trip;
  trip.id           = id;
  trip.requester_id = requester;
  trip.status       = TRIP_STATUS_PENDING;
  trip.service_type = SERVICE_TYPE_STANDARD;
  trip.version      = 1;

  auto tx = repo.Begin();
  assert(repo.InsertTrip(*tx, trip));
  tx->Commit();
  return trip;
}

void TestLifecycleStampsAndRecordsHistory() {
  ManualClock clock;
  auto        repo = std::make_shared<dispatch::db::memory::MemoryRepository>();
  dispatch::lifecycle::TripLifecycle lifecycle(repo, clock.Fn());

  auto trip = InsertPending(*repo, "trip-1", "rider-1");

  {
    auto tx = repo->Begin();
    lifecycle.Transition(*tx, trip, TRIP_STATUS_SEARCHING, dispatch::lifecycle::SystemActor("dispatch now"));
    tx->Commit();
  }
  assert(trip.status == TRIP_STATUS_SEARCHING);
  assert(trip.searching_at_ms == clock.NowMs());
  assert(trip.version == 2);

  clock.Advance(std::chrono::seconds(5));

  dispatch::lifecycle::TransitionContext ctx;
  ctx.actor_id   = "rider-1";
  ctx.actor_role = USER_ROLE_REQUESTER;
  ctx.location   = dispatch::geo::LatLng{1.5, 2.5};
  ctx.note       = "changed my mind";
  {
    auto tx = repo->Begin();
    lifecycle.Transition(*tx, trip, TRIP_STATUS_CANCELLED, ctx);
    tx->Commit();
  }
  assert(trip.cancelled_at_ms == clock.NowMs());

  auto tx      = repo->Begin();
  auto stored  = repo->GetTrip(*tx, "trip-1");
  auto history = repo->ListStatusChanges(*tx, "trip-1");
  tx->Commit();

  assert(stored && stored->status == TRIP_STATUS_CANCELLED);
  assert(history.size() == 2);
  assert(history[0].from_status == TRIP_STATUS_PENDING && history[0].to_status == TRIP_STATUS_SEARCHING);
  assert(history[0].actor_id == "system");
  assert(history[1].from_status == TRIP_STATUS_SEARCHING && history[1].to_status == TRIP_STATUS_CANCELLED);
  assert(history[1].actor_role == USER_ROLE_REQUESTER);
  assert(history[1].has_location && history[1].lat == 1.5 && history[1].lng == 2.5);
  assert(history[1].note == "changed my mind");
}

void TestLifecycleRejectsEdgeOutsideTable() {
  ManualClock clock;
  auto        repo = std::make_shared<dispatch::db::memory::MemoryRepository>();
  dispatch::lifecycle::TripLifecycle lifecycle(repo, clock.Fn());

  auto trip = InsertPending(*repo, "trip-2", "rider-2");

  auto tx = repo->Begin();
  assert(Throws<dispatch::util::InvalidTransition>(
      [&] { lifecycle.Transition(*tx, trip, TRIP_STATUS_COMPLETED, dispatch::lifecycle::SystemActor()); }));
  assert(trip.status == TRIP_STATUS_PENDING);
  tx->Rollback();
}

void TestLifecycleEnforcesOneActiveTripPerRequester() {
  ManualClock clock;
  auto        repo = std::make_shared<dispatch::db::memory::MemoryRepository>();
  dispatch::lifecycle::TripLifecycle lifecycle(repo, clock.Fn());

  auto first  = InsertPending(*repo, "trip-a", "rider-3");
  auto second = InsertPending(*repo, "trip-b", "rider-3");

  {
    auto tx = repo->Begin();
    lifecycle.Transition(*tx, first, TRIP_STATUS_SEARCHING, dispatch::lifecycle::SystemActor());
    tx->Commit();
  }

  auto tx = repo->Begin();
  assert(Throws<dispatch::util::ActiveTripConflict>(
      [&] { lifecycle.Transition(*tx, second, TRIP_STATUS_SEARCHING, dispatch::lifecycle::SystemActor()); }));
}

void TestLifecycleDetectsStaleVersion() {
  ManualClock clock;
  auto        repo = std::make_shared<dispatch::db::memory::MemoryRepository>();
  dispatch::lifecycle::TripLifecycle lifecycle(repo, clock.Fn());

  auto trip  = InsertPending(*repo, "trip-c", "rider-4");
  auto stale = trip;

  {
    auto tx = repo->Begin();
    lifecycle.Transition(*tx, trip, TRIP_STATUS_SEARCHING, dispatch::lifecycle::SystemActor());
    tx->Commit();
  }

  auto tx = repo->Begin();
  assert(Throws<dispatch::db::TransactionConflict>(
      [&] { lifecycle.Transition(*tx, stale, TRIP_STATUS_SCHEDULED, dispatch::lifecycle::SystemActor()); }));
}

} // namespace

int main() {
  TestHappyPathIsAllowed();
  TestSkipsAreRejected();
  TestCancelReachableFromEveryNonTerminalState();
  TestTerminalStatesAreFinal();
  TestReassignmentOnlyBeforePickup();
  TestActiveSet();
  TestLifecycleStampsAndRecordsHistory();
  TestLifecycleRejectsEdgeOutsideTable();
  TestLifecycleEnforcesOneActiveTripPerRequester();
  TestLifecycleDetectsStaleVersion();

  std::cout << "dispatch_unit_trip_state_machine: pass\n";
  return 0;
}
