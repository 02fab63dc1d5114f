#include "internal/payment/hold_coordinator.hpp"

#include "internal/db/api/result_check.hpp"
#include "internal/model/trip_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::payment {

using namespace dispatch::core::v1;

std::string HoldReference(const std::string& trip_id) {
  return "hold_" + trip_id;
}

std::string RefundReference(const std::string& trip_id) {
  return "refund_" + trip_id;
}

std::string FareReference(const std::string& trip_id) {
  return "fare_" + trip_id;
}

std::string TipReference(const std::string& trip_id) {
  return "tip_" + trip_id;
}

HoldCoordinator::HoldCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                                 util::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)), lifecycle_(std::move(lifecycle)), retry_(retry), now_(std::move(now)) {
}

db::model::LedgerEntryRecord HoldCoordinator::NewEntry(const std::string& account_id, const std::string& trip_id, LedgerEntryType type,
                                                       int64_t amount, const std::string& currency, const std::string& reference) const {
  db::model::LedgerEntryRecord entry;
  entry.id            = util::NewId();
  entry.account_id    = account_id;
  entry.trip_id       = trip_id;
  entry.type          = type;
  entry.status        = LEDGER_ENTRY_STATUS_COMPLETED;
  entry.amount        = amount;
  entry.currency      = currency;
  entry.reference     = reference;
  entry.created_at_ms = util::ToUnixMillis(now_());
  return entry;
}

HoldResult HoldCoordinator::CreateTripWithHold(const TripDraft& draft) {
  if (draft.requester_id.empty()) {
    throw util::InvalidArgument("requester id is required");
  }
  if (draft.estimated_fare <= 0) {
    throw util::InvalidArgument("estimated fare must be positive");
  }

  const bool scheduled = draft.scheduled_at_ms != 0;
  const bool cash      = draft.payment_method == PAYMENT_METHOD_CASH;

  return util::RetryOnConflict(retry_, "create_trip_with_hold", [&] {
    auto tx = repository_->Begin();

    db::ThrowIfDbError(repository_->LockAccount(*tx, draft.requester_id), "lock account");

    // a scheduled trip only becomes active when it is promoted
    if (!scheduled && !repository_->ListActiveTripsForRequester(*tx, draft.requester_id).empty()) {
      throw util::ActiveTripConflict("requester " + draft.requester_id + " already has an active trip");
    }

    if (!cash) {
      const auto available = repository_->AvailableBalance(*tx, draft.requester_id);
      if (available < draft.estimated_fare) {
        throw util::InsufficientFunds("available balance " + std::to_string(available) + " does not cover estimated fare " +
                                      std::to_string(draft.estimated_fare));
      }
    }

    db::model::TripRecord trip;
    trip.id              = util::NewId();
    trip.requester_id    = draft.requester_id;
    trip.status          = TRIP_STATUS_PENDING;
    trip.pickup_lat      = draft.pickup.lat;
    trip.pickup_lng      = draft.pickup.lng;
    trip.pickup_address  = draft.pickup_address;
    trip.dropoff_lat     = draft.dropoff.lat;
    trip.dropoff_lng     = draft.dropoff.lng;
    trip.dropoff_address = draft.dropoff_address;
    trip.service_type    = draft.service_type;
    trip.vehicle_type    = draft.vehicle_type;
    trip.payment_method  = draft.payment_method;
    trip.estimated_fare  = draft.estimated_fare;
    trip.currency        = draft.currency;
    trip.distance_km     = draft.distance_km;
    trip.duration_min    = draft.duration_min;
    trip.scheduled_at_ms = draft.scheduled_at_ms;
    trip.pickup_code     = draft.pickup_code;
    trip.delivery_code   = draft.delivery_code;
    trip.created_at_ms   = util::ToUnixMillis(now_());
    trip.version         = 1;

    std::optional<db::model::LedgerEntryRecord> hold;
    if (!cash) {
      hold         = NewEntry(draft.requester_id, trip.id, LEDGER_ENTRY_TYPE_HOLD, draft.estimated_fare, draft.currency, HoldReference(trip.id));
      trip.hold_id = hold->id;
    }

    const auto inserted = repository_->InsertTrip(*tx, trip);
    if (inserted.code == db::ErrorCode::ConstraintViolation) {
      throw util::ActiveTripConflict("requester " + draft.requester_id + " already has an active trip");
    }
    db::ThrowIfDbError(inserted, "insert trip");

    if (hold) {
      db::ThrowIfDbError(repository_->InsertLedgerEntry(*tx, *hold), "insert hold");
    }

    lifecycle::TransitionContext ctx;
    ctx.actor_id   = draft.requester_id;
    ctx.actor_role = USER_ROLE_REQUESTER;
    lifecycle_->Transition(*tx, trip, scheduled ? TRIP_STATUS_SCHEDULED : TRIP_STATUS_SEARCHING, ctx);

    tx->Commit();

    DISPATCH_LOG_INFO("trip created", {observability::StringField("trip_id", trip.id), observability::StringField("requester_id", trip.requester_id),
                                       observability::StringField("status", TripStatus_Name(trip.status)),
                                       observability::IntField("estimated_fare", trip.estimated_fare)});

    HoldResult result;
    result.hold_id = trip.hold_id;
    result.trip    = std::move(trip);
    return result;
  });
}

std::optional<db::model::LedgerEntryRecord> HoldCoordinator::ReleaseHold(db::Transaction& tx, const db::model::TripRecord& trip) {
  if (trip.hold_id.empty()) {
    return std::nullopt;
  }
  if (repository_->FindSettlement(tx, trip.hold_id)) {
    return std::nullopt;
  }

  auto hold = repository_->GetLedgerEntry(tx, trip.hold_id);
  if (!hold) {
    throw util::NotFound("hold " + trip.hold_id + " of trip " + trip.id + " is missing");
  }

  auto refund             = NewEntry(hold->account_id, trip.id, LEDGER_ENTRY_TYPE_REFUND, hold->amount, hold->currency, RefundReference(trip.id));
  refund.settles_entry_id = hold->id;

  const auto result = repository_->InsertLedgerEntry(tx, refund);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    // settled by a concurrent writer; replay sees the settlement
    throw db::TransactionConflict("hold " + hold->id + " settled concurrently");
  }
  db::ThrowIfDbError(result, "insert refund");

  DISPATCH_LOG_INFO("hold released", {observability::StringField("trip_id", trip.id), observability::IntField("amount", hold->amount)});
  return refund;
}

std::optional<db::model::LedgerEntryRecord> HoldCoordinator::SettleHold(db::Transaction& tx, const db::model::TripRecord& trip, int64_t amount) {
  if (trip.hold_id.empty()) {
    return std::nullopt;
  }
  if (amount <= 0) {
    throw util::InvalidArgument("settled fare must be positive");
  }
  if (auto existing = repository_->FindSettlement(tx, trip.hold_id)) {
    throw util::InvalidState("hold " + trip.hold_id + " is already settled");
  }

  auto hold = repository_->GetLedgerEntry(tx, trip.hold_id);
  if (!hold) {
    throw util::NotFound("hold " + trip.hold_id + " of trip " + trip.id + " is missing");
  }

  auto debit             = NewEntry(hold->account_id, trip.id, LEDGER_ENTRY_TYPE_DEBIT, amount, hold->currency, FareReference(trip.id));
  debit.settles_entry_id = hold->id;

  const auto result = repository_->InsertLedgerEntry(tx, debit);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw db::TransactionConflict("hold " + hold->id + " settled concurrently");
  }
  db::ThrowIfDbError(result, "insert fare debit");
  return debit;
}

void HoldCoordinator::PostTip(db::Transaction& tx, const db::model::TripRecord& trip, int64_t amount) {
  if (trip.worker_id.empty()) {
    throw util::InvalidState("trip " + trip.id + " has no worker to tip");
  }

  db::ThrowIfDbError(repository_->LockAccount(tx, trip.requester_id), "lock account");

  const auto available = repository_->AvailableBalance(tx, trip.requester_id);
  if (available < amount) {
    throw util::InsufficientFunds("available balance " + std::to_string(available) + " does not cover tip " + std::to_string(amount));
  }

  const auto reference = TipReference(trip.id);
  db::ThrowIfDbError(repository_->InsertLedgerEntry(tx, NewEntry(trip.requester_id, trip.id, LEDGER_ENTRY_TYPE_DEBIT, amount, trip.currency, reference)),
                     "insert tip debit");
  db::ThrowIfDbError(repository_->InsertLedgerEntry(tx, NewEntry(trip.worker_id, trip.id, LEDGER_ENTRY_TYPE_CREDIT, amount, trip.currency, reference)),
                     "insert tip credit");
}

db::model::LedgerEntryRecord HoldCoordinator::PostCredit(const std::string& account_id, int64_t amount, const std::string& currency,
                                                         const std::string& reference) {
  if (account_id.empty()) {
    throw util::InvalidArgument("account id is required");
  }
  if (amount <= 0) {
    throw util::InvalidArgument("credit amount must be positive");
  }

  return util::RetryOnConflict(retry_, "post_credit", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->LockAccount(*tx, account_id), "lock account");

    auto entry = NewEntry(account_id, {}, LEDGER_ENTRY_TYPE_CREDIT, amount, currency.empty() ? "USD" : currency, reference);
    db::ThrowIfDbError(repository_->InsertLedgerEntry(*tx, entry), "insert credit");
    tx->Commit();
    return entry;
  });
}

int64_t HoldCoordinator::AvailableBalance(const std::string& account_id) {
  auto tx      = repository_->Begin();
  auto balance = repository_->AvailableBalance(*tx, account_id);
  tx->Commit();
  return balance;
}

} // namespace dispatch::payment
