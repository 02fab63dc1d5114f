#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/core/caller.hpp"
#include "internal/core/trip_manager.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fare/fare_calculator.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/location/location_registry.hpp"
#include "internal/matching/batch_dispatcher.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/matching/response_arbiter.hpp"
#include "internal/notify/event_sink.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/routing/route_provider.hpp"
#include "internal/schedule/scheduled_trigger.hpp"
#include "internal/util/time.hpp"

namespace dispatch::testing {

using namespace dispatch::core::v1;

// Downtown reference point; short rides from here price at the minimum fare.
inline constexpr geo::LatLng kPickup{37.7749, -122.4194};
inline constexpr geo::LatLng kDropoff{37.7790, -122.4194};

// km north of origin along the meridian
inline geo::LatLng North(const geo::LatLng& origin, double km) {
  return {origin.lat + km / (geo::kEarthRadiusKm * 3.14159265358979323846 / 180.0), origin.lng};
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Time only moves when the test says so.
class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms = 1'700'000'000'000ULL) : now_ms_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {
  }

  util::TimePoint Now() const {
    return util::FromUnixMillis(now_ms_->load());
  }

  uint64_t NowMs() const {
    return now_ms_->load();
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms_->fetch_add(static_cast<uint64_t>(by.count()));
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_ms_;
};

class RecordingSink final : public notify::EventSink {
 public:
  bool Deliver(const dispatch::events::v1::TripEvent& event) override {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }
    events_.push_back(event);
    return true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

  std::vector<dispatch::events::v1::TripEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::size_t Count(dispatch::events::v1::EventType type) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& event : events_) {
      if (event.type() == type) {
        ++n;
      }
    }
    return n;
  }

  bool IsClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex                            mutex_;
  std::vector<dispatch::events::v1::TripEvent> events_;
  bool                                          closed_ = false;
};

// Defaults with retry backoff short enough for tests.
inline config::Settings FastSettings() {
  config::Settings settings;
  settings.fares                       = config::DefaultFares();
  settings.store_retry.initial_backoff = std::chrono::milliseconds(1);
  settings.store_retry.max_backoff     = std::chrono::milliseconds(2);
  return settings;
}

inline core::Caller Requester(const std::string& id) {
  return {id, USER_ROLE_REQUESTER};
}

inline core::Caller Worker(const std::string& id) {
  return {id, USER_ROLE_WORKER};
}

inline core::Caller Admin(const std::string& id = "admin-1") {
  return {id, USER_ROLE_ADMIN};
}

/*
  The full memory-backed component graph, wired the way the factory
  wires it, on a manual clock. No timer and no background tasks: tests
  drive Reconcile, Sweep and RunOnce themselves.
*/
struct Harness {
  explicit Harness(config::Settings s = FastSettings())
      : settings(std::move(s)),
        repository(std::make_shared<db::memory::MemoryRepository>()),
        notifier(std::make_shared<notify::Notifier>(clock.Fn())) {
    routes     = std::make_shared<routing::StraightLineRouteProvider>(settings.average_speed_kmh);
    fares      = std::make_shared<fare::FareCalculator>(routes, settings.fares);
    registry   = std::make_shared<location::LocationRegistry>(repository, settings.location, clock.Fn());
    lifecycle  = std::make_shared<lifecycle::TripLifecycle>(repository, clock.Fn());
    holds      = std::make_shared<payment::HoldCoordinator>(repository, lifecycle, settings.store_retry, clock.Fn());
    selector   = std::make_shared<matching::CandidateSelector>(repository, registry, settings.dispatch, settings.average_speed_kmh);
    dispatcher = std::make_shared<matching::BatchDispatcher>(repository, selector, lifecycle, holds, notifier, settings.dispatch,
                                                             settings.store_retry, clock.Fn());
    arbiter    = std::make_shared<matching::ResponseArbiter>(repository, lifecycle, notifier, settings.store_retry, clock.Fn());
    trigger    = std::make_shared<schedule::ScheduledTrigger>(repository, lifecycle, holds, dispatcher, notifier, settings.store_retry, clock.Fn());
    manager    = std::make_shared<core::TripManager>(repository, fares, holds, lifecycle, dispatcher, arbiter, registry, notifier, settings,
                                                     clock.Fn());
  }

  db::model::WorkerRecord AddWorker(const std::string& id, const geo::LatLng& at, ServiceType service = SERVICE_TYPE_STANDARD,
                                    VehicleType vehicle = VEHICLE_TYPE_CAR, uint32_t max_active_trips = 1) {
    db::model::WorkerRecord worker;
    worker.id               = id;
    worker.service_mask     = 1u << static_cast<uint32_t>(service);
    worker.vehicle_type     = vehicle;
    worker.eligible         = true;
    worker.max_active_trips = max_active_trips;
    worker.updated_at_ms    = clock.NowMs();

    auto tx = repository->Begin();
    db::ThrowIfDbError(repository->UpsertWorker(*tx, worker), "upsert worker");
    tx->Commit();
    registry->RefreshWorker(worker);

    MoveWorker(id, at);
    return worker;
  }

  // Fresh online/available report at the current time.
  void MoveWorker(const std::string& id, const geo::LatLng& at, bool available = true) {
    db::model::WorkerLocationRecord location;
    location.worker_id = id;
    location.lat       = at.lat;
    location.lng       = at.lng;
    location.online    = true;
    location.available = available;
    registry->Report(location);
  }

  void Credit(const std::string& account, int64_t amount) {
    holds->PostCredit(account, amount, "USD", "test-topup");
  }

  int64_t Balance(const std::string& account) {
    return holds->AvailableBalance(account);
  }

  std::shared_ptr<RecordingSink> Listen(const std::string& user_id, UserRole role) {
    auto sink = std::make_shared<RecordingSink>();
    notifier->Register("conn-" + user_id + "-" + std::to_string(++connections_), user_id, role, sink);
    return sink;
  }

  core::TripRequest Ride(PaymentMethod payment = PAYMENT_METHOD_WALLET, ServiceType service = SERVICE_TYPE_STANDARD) const {
    core::TripRequest request;
    request.pickup          = kPickup;
    request.pickup_address  = "1 Market St";
    request.dropoff         = kDropoff;
    request.dropoff_address = "500 Van Ness Ave";
    request.service_type    = service;
    request.payment_method  = payment;
    return request;
  }

  // A searching trip with its hold in place and no offers; dispatch is
  // left to the test.
  db::model::TripRecord SearchingTrip(const std::string& requester, PaymentMethod payment = PAYMENT_METHOD_CASH,
                                      ServiceType service = SERVICE_TYPE_STANDARD) {
    payment::TripDraft draft;
    draft.requester_id   = requester;
    draft.pickup         = kPickup;
    draft.dropoff        = kDropoff;
    draft.service_type   = service;
    draft.payment_method = payment;
    draft.estimated_fare = 500;
    draft.currency       = "USD";
    return holds->CreateTripWithHold(draft).trip;
  }

  db::model::TripRecord Trip(const std::string& trip_id) {
    auto tx   = repository->Begin();
    auto trip = repository->GetTrip(*tx, trip_id);
    tx->Commit();
    if (!trip) {
      throw util::NotFound("trip " + trip_id);
    }
    return *trip;
  }

  std::vector<db::model::OfferRecord> Offers(const std::string& trip_id) {
    auto tx     = repository->Begin();
    auto offers = repository->ListOffersForTrip(*tx, trip_id);
    tx->Commit();
    return offers;
  }

  std::vector<db::model::OfferRecord> OffersWithStatus(const std::string& trip_id, OfferStatus status) {
    std::vector<db::model::OfferRecord> out;
    for (auto& offer : Offers(trip_id)) {
      if (offer.status == status) {
        out.push_back(std::move(offer));
      }
    }
    return out;
  }

  std::vector<db::model::LedgerEntryRecord> Ledger(const std::string& account) {
    auto tx      = repository->Begin();
    auto entries = repository->ListLedgerEntries(*tx, account);
    tx->Commit();
    return entries;
  }

  std::vector<db::model::StatusChangeRecord> History(const std::string& trip_id) {
    auto tx      = repository->Begin();
    auto changes = repository->ListStatusChanges(*tx, trip_id);
    tx->Commit();
    return changes;
  }

  ManualClock      clock;
  config::Settings settings;

  std::shared_ptr<db::memory::MemoryRepository>  repository;
  std::shared_ptr<notify::Notifier>              notifier;
  std::shared_ptr<routing::RouteProvider>        routes;
  std::shared_ptr<fare::FareCalculator>          fares;
  std::shared_ptr<location::LocationRegistry>    registry;
  std::shared_ptr<lifecycle::TripLifecycle>      lifecycle;
  std::shared_ptr<payment::HoldCoordinator>      holds;
  std::shared_ptr<matching::CandidateSelector>   selector;
  std::shared_ptr<matching::BatchDispatcher>     dispatcher;
  std::shared_ptr<matching::ResponseArbiter>     arbiter;
  std::shared_ptr<schedule::ScheduledTrigger>    trigger;
  std::shared_ptr<core::TripManager>             manager;

 private:
  int connections_ = 0;
};

} // namespace dispatch::testing
