#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace dispatch::payment {

// Everything needed to create a trip; ids, status and milestones are filled in.
struct TripDraft {
  std::string requester_id;

  geo::LatLng pickup;
  std::string pickup_address;
  geo::LatLng dropoff;
  std::string dropoff_address;

  dispatch::core::v1::ServiceType   service_type   = dispatch::core::v1::SERVICE_TYPE_UNSPECIFIED;
  dispatch::core::v1::VehicleType   vehicle_type   = dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED;
  dispatch::core::v1::PaymentMethod payment_method = dispatch::core::v1::PAYMENT_METHOD_UNSPECIFIED;

  int64_t     estimated_fare = 0;
  std::string currency;
  double      distance_km  = 0;
  int32_t     duration_min = 0;

  // 0 = dispatch now
  uint64_t scheduled_at_ms = 0;

  // delivery trips only
  std::string pickup_code;
  std::string delivery_code;
};

struct HoldResult {
  db::model::TripRecord trip;
  std::string           hold_id; // empty for cash
};

// Ledger references, one per trip and purpose.
std::string HoldReference(const std::string& trip_id);
std::string RefundReference(const std::string& trip_id);
std::string FareReference(const std::string& trip_id);
std::string TipReference(const std::string& trip_id);

/*
  Owns every wallet movement tied to a trip.

  CreateTripWithHold is one transaction: account lock, active-trip
  check, balance check, trip insert, hold insert and the first status
  transition commit together or not at all. Store conflicts are
  retried with backoff and surface as StoreConflict.

  ReleaseHold / SettleHold / PostTip run inside the caller's
  transaction so they commit atomically with the status change that
  caused them. A hold is settled by exactly one refund or debit.
*/
class HoldCoordinator {
 public:
  HoldCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                  util::RetryPolicy retry, util::NowFn now = util::Now);

  // InsufficientFunds, ActiveTripConflict, StoreConflict
  HoldResult CreateTripWithHold(const TripDraft& draft);

  // Refunds the trip's hold. nullopt for cash trips or an already settled hold.
  std::optional<db::model::LedgerEntryRecord> ReleaseHold(db::Transaction& tx, const db::model::TripRecord& trip);

  // Converts the hold into a debit of amount. nullopt for cash trips.
  std::optional<db::model::LedgerEntryRecord> SettleHold(db::Transaction& tx, const db::model::TripRecord& trip, int64_t amount);

  // Requester debit + worker credit. InsufficientFunds when the wallet can't cover it.
  void PostTip(db::Transaction& tx, const db::model::TripRecord& trip, int64_t amount);

  db::model::LedgerEntryRecord PostCredit(const std::string& account_id, int64_t amount, const std::string& currency, const std::string& reference);

  int64_t AvailableBalance(const std::string& account_id);

 private:
  db::model::LedgerEntryRecord NewEntry(const std::string& account_id, const std::string& trip_id, dispatch::core::v1::LedgerEntryType type,
                                        int64_t amount, const std::string& currency, const std::string& reference) const;

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<lifecycle::TripLifecycle> lifecycle_;
  util::RetryPolicy                         retry_;
  util::NowFn                               now_;
};

} // namespace dispatch::payment
