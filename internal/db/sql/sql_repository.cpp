#include "internal/db/sql/sql_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace dispatch::db::sql {

namespace v1 = dispatch::core::v1;

namespace {

int32_t E(int value) {
  return static_cast<int32_t>(value);
}

Params ActiveStatuses(const std::string& key) {
  return {key,
          E(v1::TRIP_STATUS_SEARCHING),
          E(v1::TRIP_STATUS_ASSIGNED),
          E(v1::TRIP_STATUS_ARRIVED_PICKUP),
          E(v1::TRIP_STATUS_IN_PROGRESS),
          E(v1::TRIP_STATUS_ARRIVED_DROPOFF)};
}

model::TripRecord ReadTrip(const Row& row) {
  model::TripRecord r;
  r.id                    = row.GetText(0);
  r.requester_id          = row.GetText(1);
  r.worker_id             = row.GetText(2);
  r.status                = static_cast<v1::TripStatus>(row.GetInt(3));
  r.pickup_lat            = row.GetDouble(4);
  r.pickup_lng            = row.GetDouble(5);
  r.pickup_address        = row.GetText(6);
  r.dropoff_lat           = row.GetDouble(7);
  r.dropoff_lng           = row.GetDouble(8);
  r.dropoff_address       = row.GetText(9);
  r.service_type          = static_cast<v1::ServiceType>(row.GetInt(10));
  r.vehicle_type          = static_cast<v1::VehicleType>(row.GetInt(11));
  r.payment_method        = static_cast<v1::PaymentMethod>(row.GetInt(12));
  r.estimated_fare        = row.GetInt64(13);
  r.final_fare            = row.GetInt64(14);
  r.tip_amount            = row.GetInt64(15);
  r.currency              = row.GetText(16);
  r.hold_id               = row.GetText(17);
  r.distance_km           = row.GetDouble(18);
  r.duration_min          = row.GetInt(19);
  r.dispatch_batch        = static_cast<uint32_t>(row.GetInt(20));
  r.escalation_level      = static_cast<uint32_t>(row.GetInt(21));
  r.cancellation_reason   = static_cast<v1::CancellationReason>(row.GetInt(22));
  r.cancellation_note     = row.GetText(23);
  r.scheduled_at_ms       = row.GetU64(24);
  r.created_at_ms         = row.GetU64(25);
  r.searching_at_ms       = row.GetU64(26);
  r.assigned_at_ms        = row.GetU64(27);
  r.arrived_at_ms         = row.GetU64(28);
  r.started_at_ms         = row.GetU64(29);
  r.arrived_dropoff_at_ms = row.GetU64(30);
  r.completed_at_ms       = row.GetU64(31);
  r.cancelled_at_ms       = row.GetU64(32);
  r.pickup_code           = row.GetText(33);
  r.delivery_code         = row.GetText(34);
  r.worker_rating         = static_cast<uint32_t>(row.GetInt(35));
  r.worker_feedback       = row.GetText(36);
  r.requester_rating      = static_cast<uint32_t>(row.GetInt(37));
  r.requester_feedback    = row.GetText(38);
  r.pickup_verified_at_ms   = row.GetU64(39);
  r.delivery_verified_at_ms = row.GetU64(40);
  r.version               = row.GetU64(41);
  return r;
}

// Columns shared by INSERT_TRIP (after id/requester/worker) and UPDATE_TRIP.
void AppendTripBody(Params& p, const model::TripRecord& r) {
  p.insert(p.end(), {E(r.status),           r.pickup_lat,        r.pickup_lng,          r.pickup_address,   r.dropoff_lat,
                     r.dropoff_lng,         r.dropoff_address,   E(r.service_type),     E(r.vehicle_type),  E(r.payment_method),
                     r.estimated_fare,      r.final_fare,        r.tip_amount,          r.currency,         r.hold_id,
                     r.distance_km,         E(r.duration_min),   E(static_cast<int>(r.dispatch_batch)),
                     E(static_cast<int>(r.escalation_level)),    E(r.cancellation_reason), r.cancellation_note,
                     r.scheduled_at_ms,     r.created_at_ms,     r.searching_at_ms,     r.assigned_at_ms,   r.arrived_at_ms,
                     r.started_at_ms,       r.arrived_dropoff_at_ms, r.completed_at_ms, r.cancelled_at_ms,
                     r.pickup_code,         r.delivery_code,     E(static_cast<int>(r.worker_rating)), r.worker_feedback,
                     E(static_cast<int>(r.requester_rating)),    r.requester_feedback,
                     r.pickup_verified_at_ms, r.delivery_verified_at_ms});
}

model::OfferRecord ReadOffer(const Row& row) {
  model::OfferRecord r;
  r.id              = row.GetText(0);
  r.trip_id         = row.GetText(1);
  r.worker_id       = row.GetText(2);
  r.status          = static_cast<v1::OfferStatus>(row.GetInt(3));
  r.batch_number    = static_cast<uint32_t>(row.GetInt(4));
  r.distance_km     = row.GetDouble(5);
  r.eta_minutes     = row.GetInt(6);
  r.reason          = row.GetText(7);
  r.sent_at_ms      = row.GetU64(8);
  r.responded_at_ms = row.GetU64(9);
  r.expires_at_ms   = row.GetU64(10);
  return r;
}

model::LedgerEntryRecord ReadLedgerEntry(const Row& row) {
  model::LedgerEntryRecord r;
  r.id               = row.GetText(0);
  r.account_id       = row.GetText(1);
  r.trip_id          = row.GetText(2);
  r.type             = static_cast<v1::LedgerEntryType>(row.GetInt(3));
  r.amount           = row.GetInt64(4);
  r.currency         = row.GetText(5);
  r.status           = static_cast<v1::LedgerEntryStatus>(row.GetInt(6));
  r.reference        = row.GetText(7);
  r.settles_entry_id = row.GetText(8);
  r.created_at_ms    = row.GetU64(9);
  return r;
}

model::WorkerRecord ReadWorker(const Row& row) {
  model::WorkerRecord r;
  r.id               = row.GetText(0);
  r.service_mask     = static_cast<uint32_t>(row.GetInt64(1));
  r.vehicle_type     = static_cast<v1::VehicleType>(row.GetInt(2));
  r.eligible         = row.GetBool(3);
  r.max_active_trips = static_cast<uint32_t>(row.GetInt(4));
  r.rating           = row.GetDouble(5);
  r.rating_count     = static_cast<uint32_t>(row.GetInt(6));
  r.updated_at_ms    = row.GetU64(7);
  return r;
}

model::WorkerLocationRecord ReadLocation(const Row& row) {
  model::WorkerLocationRecord r;
  r.worker_id      = row.GetText(0);
  r.lat            = row.GetDouble(1);
  r.lng            = row.GetDouble(2);
  r.heading        = row.GetDouble(3);
  r.speed          = row.GetDouble(4);
  r.accuracy       = row.GetDouble(5);
  r.online         = row.GetBool(6);
  r.available      = row.GetBool(7);
  r.captured_at_ms = row.GetU64(8);
  return r;
}

model::ShareTokenRecord ReadShareToken(const Row& row) {
  model::ShareTokenRecord r;
  r.token         = row.GetText(0);
  r.trip_id       = row.GetText(1);
  r.created_by    = row.GetText(2);
  r.created_at_ms = row.GetU64(3);
  r.expires_at_ms = row.GetU64(4);
  r.revoked_at_ms = row.GetU64(5);
  return r;
}

} // namespace

Result SqlRepository::ExecuteConditional(Transaction& t, const char* sql, const Params& params, const char* what) {
  uint64_t affected = 0;
  auto     result   = Execute(t, sql, params, &affected);
  if (!result) return result;
  if (affected == 0) return Result::Err(ErrorCode::Conflict, what);
  return Result::Ok();
}

std::vector<model::TripRecord> SqlRepository::QueryTrips(Transaction& t, const char* sql, const Params& params) {
  std::vector<model::TripRecord> out;
  Query(t, sql, params, [&](const Row& row) { out.push_back(ReadTrip(row)); });
  return out;
}

std::vector<model::OfferRecord> SqlRepository::QueryOffers(Transaction& t, const char* sql, const Params& params) {
  std::vector<model::OfferRecord> out;
  Query(t, sql, params, [&](const Row& row) { out.push_back(ReadOffer(row)); });
  return out;
}

std::vector<model::LedgerEntryRecord> SqlRepository::QueryLedger(Transaction& t, const char* sql, const Params& params) {
  std::vector<model::LedgerEntryRecord> out;
  Query(t, sql, params, [&](const Row& row) { out.push_back(ReadLedgerEntry(row)); });
  return out;
}

// ------------------------------------------------------------------
// Trips
// ------------------------------------------------------------------

Result SqlRepository::InsertTrip(Transaction& t, const model::TripRecord& r) {
  Params p{r.id, r.requester_id, NullableText(r.worker_id)};
  AppendTripBody(p, r);
  p.emplace_back(r.version);
  return Execute(t, INSERT_TRIP, p);
}

std::optional<model::TripRecord> SqlRepository::GetTrip(Transaction& t, const std::string& id) {
  auto rows = QueryTrips(t, SELECT_TRIP, {id});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::UpdateTrip(Transaction& t, const model::TripRecord& r, uint64_t expected_version) {
  Params p;
  AppendTripBody(p, r);
  p.emplace_back(r.id);
  p.emplace_back(expected_version);
  return ExecuteConditional(t, UPDATE_TRIP, p, "trip version changed");
}

Result SqlRepository::BindWorker(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  return ExecuteConditional(t, BIND_WORKER, {worker_id, trip_id, E(v1::TRIP_STATUS_SEARCHING)}, "trip not open for binding");
}

Result SqlRepository::ReleaseWorker(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  return ExecuteConditional(t, RELEASE_WORKER, {trip_id, worker_id}, "worker not bound to trip");
}

std::vector<model::TripRecord> SqlRepository::ListActiveTripsForRequester(Transaction& t, const std::string& requester_id) {
  return QueryTrips(t, SELECT_ACTIVE_TRIPS_FOR_REQUESTER, ActiveStatuses(requester_id));
}

std::vector<model::TripRecord> SqlRepository::ListActiveTripsForWorker(Transaction& t, const std::string& worker_id) {
  return QueryTrips(t, SELECT_ACTIVE_TRIPS_FOR_WORKER, ActiveStatuses(worker_id));
}

std::vector<model::TripRecord> SqlRepository::ListTripsByStatus(Transaction& t, v1::TripStatus status) {
  return QueryTrips(t, SELECT_TRIPS_BY_STATUS, {E(status)});
}

std::vector<model::TripRecord> SqlRepository::ListDueScheduledTrips(Transaction& t, uint64_t now_ms) {
  return QueryTrips(t, SELECT_DUE_SCHEDULED_TRIPS, {E(v1::TRIP_STATUS_SCHEDULED), now_ms});
}

Result SqlRepository::AppendStatusChange(Transaction& t, const model::StatusChangeRecord& r) {
  return Execute(t, INSERT_STATUS_CHANGE,
                 {r.trip_id, E(r.from_status), E(r.to_status), r.actor_id, E(r.actor_role), Bool(r.has_location), r.lat, r.lng, r.note,
                  r.at_ms});
}

std::vector<model::StatusChangeRecord> SqlRepository::ListStatusChanges(Transaction& t, const std::string& trip_id) {
  std::vector<model::StatusChangeRecord> out;
  Query(t, SELECT_STATUS_CHANGES, {trip_id}, [&](const Row& row) {
    model::StatusChangeRecord r;
    r.trip_id      = row.GetText(0);
    r.from_status  = static_cast<v1::TripStatus>(row.GetInt(1));
    r.to_status    = static_cast<v1::TripStatus>(row.GetInt(2));
    r.actor_id     = row.GetText(3);
    r.actor_role   = static_cast<v1::UserRole>(row.GetInt(4));
    r.has_location = row.GetBool(5);
    r.lat          = row.GetDouble(6);
    r.lng          = row.GetDouble(7);
    r.note         = row.GetText(8);
    r.at_ms        = row.GetU64(9);
    out.push_back(std::move(r));
  });
  return out;
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result SqlRepository::InsertOffer(Transaction& t, const model::OfferRecord& r) {
  auto result = Execute(t, INSERT_OFFER,
                        {r.id, r.trip_id, r.worker_id, E(r.status), E(static_cast<int>(r.batch_number)), r.distance_km, E(r.eta_minutes),
                         r.reason, r.sent_at_ms, r.responded_at_ms, r.expires_at_ms});
  if (result.code == ErrorCode::ConstraintViolation) {
    return Result::Err(ErrorCode::AlreadyExists, result.message);
  }
  return result;
}

std::optional<model::OfferRecord> SqlRepository::GetOffer(Transaction& t, const std::string& id) {
  auto rows = QueryOffers(t, SELECT_OFFER, {id});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<model::OfferRecord> SqlRepository::FindOffer(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  auto rows = QueryOffers(t, SELECT_OFFER_BY_TRIP_WORKER, {trip_id, worker_id});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::OfferRecord> SqlRepository::ListOffersForTrip(Transaction& t, const std::string& trip_id) {
  return QueryOffers(t, SELECT_OFFERS_FOR_TRIP, {trip_id});
}

std::vector<model::OfferRecord> SqlRepository::ListPendingOffersForWorker(Transaction& t, const std::string& worker_id) {
  return QueryOffers(t, SELECT_PENDING_OFFERS_FOR_WORKER, {worker_id, E(v1::OFFER_STATUS_PENDING)});
}

uint32_t SqlRepository::CountPendingOffersForWorker(Transaction& t, const std::string& worker_id, const std::string& exclude_trip_id) {
  uint32_t count = 0;
  Query(t, COUNT_PENDING_OFFERS_FOR_WORKER, {worker_id, E(v1::OFFER_STATUS_PENDING), exclude_trip_id},
        [&](const Row& row) { count = static_cast<uint32_t>(row.GetInt64(0)); });
  return count;
}

std::vector<model::OfferRecord> SqlRepository::ListExpiredPendingOffers(Transaction& t, uint64_t now_ms) {
  return QueryOffers(t, SELECT_EXPIRED_PENDING_OFFERS, {E(v1::OFFER_STATUS_PENDING), now_ms});
}

Result SqlRepository::ResolveOffer(Transaction& t, const std::string& offer_id, v1::OfferStatus expected_status, v1::OfferStatus to,
                                   uint64_t at_ms, const std::string& reason) {
  return ExecuteConditional(t, RESOLVE_OFFER, {E(to), at_ms, reason, offer_id, E(expected_status)}, "offer already resolved");
}

Result SqlRepository::ResolvePendingOffers(Transaction& t, const PendingOfferFilter& filter, v1::OfferStatus to, uint64_t at_ms,
                                           const std::string& reason, std::vector<model::OfferRecord>& resolved) {
  for (auto& offer : ListOffersForTrip(t, filter.trip_id)) {
    if (offer.status != v1::OFFER_STATUS_PENDING || offer.id == filter.except_offer_id) continue;
    if (filter.expired_at_ms && offer.expires_at_ms > *filter.expired_at_ms) continue;

    auto result = ResolveOffer(t, offer.id, v1::OFFER_STATUS_PENDING, to, at_ms, reason);
    if (result.code == ErrorCode::Conflict) continue; // resolved concurrently
    if (!result) return result;

    offer.status          = to;
    offer.responded_at_ms = at_ms;
    offer.reason          = reason;
    resolved.push_back(std::move(offer));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqlRepository::LockAccount(Transaction&, const std::string&) {
  return Result::Ok();
}

Result SqlRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  return Execute(t, INSERT_LEDGER_ENTRY,
                 {r.id, r.account_id, NullableText(r.trip_id), E(r.type), r.amount, r.currency, E(r.status), r.reference,
                  NullableText(r.settles_entry_id), r.created_at_ms});
}

std::optional<model::LedgerEntryRecord> SqlRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  auto rows = QueryLedger(t, SELECT_LEDGER_ENTRY, {id});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::LedgerEntryRecord> SqlRepository::ListLedgerEntries(Transaction& t, const std::string& account_id) {
  return QueryLedger(t, SELECT_LEDGER_ENTRIES_FOR_ACCOUNT, {account_id});
}

std::vector<model::LedgerEntryRecord> SqlRepository::ListLedgerEntriesForTrip(Transaction& t, const std::string& trip_id) {
  return QueryLedger(t, SELECT_LEDGER_ENTRIES_FOR_TRIP, {trip_id});
}

std::optional<model::LedgerEntryRecord> SqlRepository::FindSettlement(Transaction& t, const std::string& hold_id) {
  auto rows = QueryLedger(t, SELECT_SETTLEMENT, {hold_id});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

int64_t SqlRepository::AvailableBalance(Transaction& t, const std::string& account_id) {
  int64_t balance = 0;
  Query(t, SELECT_AVAILABLE_BALANCE,
        {E(v1::LEDGER_ENTRY_TYPE_CREDIT), E(v1::LEDGER_ENTRY_TYPE_REFUND), E(v1::LEDGER_ENTRY_TYPE_DEBIT), E(v1::LEDGER_ENTRY_TYPE_HOLD),
         E(v1::LEDGER_ENTRY_TYPE_DEBIT), E(v1::LEDGER_ENTRY_STATUS_COMPLETED), account_id, E(v1::LEDGER_ENTRY_STATUS_COMPLETED)},
        [&](const Row& row) { balance = row.GetInt64(0); });
  return balance;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqlRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  return Execute(t, UPSERT_WORKER,
                 {r.id, static_cast<int64_t>(r.service_mask), E(r.vehicle_type), Bool(r.eligible), E(static_cast<int>(r.max_active_trips)),
                  r.updated_at_ms});
}

std::optional<model::WorkerRecord> SqlRepository::GetWorker(Transaction& t, const std::string& id) {
  std::optional<model::WorkerRecord> out;
  Query(t, SELECT_WORKER, {id}, [&](const Row& row) { out = ReadWorker(row); });
  return out;
}

std::vector<model::WorkerRecord> SqlRepository::ListWorkers(Transaction& t) {
  std::vector<model::WorkerRecord> out;
  Query(t, SELECT_WORKERS, {}, [&](const Row& row) { out.push_back(ReadWorker(row)); });
  return out;
}

RatingSummary SqlRepository::SummarizeWorkerRatings(Transaction& t, const std::string& worker_id) {
  RatingSummary summary;
  Query(t, SUMMARIZE_WORKER_RATINGS, {worker_id}, [&](const Row& row) {
    summary.average = row.GetDouble(0);
    summary.count   = static_cast<uint32_t>(row.GetInt64(1));
  });
  return summary;
}

Result SqlRepository::SetWorkerRating(Transaction& t, const std::string& worker_id, const RatingSummary& summary) {
  return ExecuteConditional(t, SET_WORKER_RATING, {summary.average, E(static_cast<int>(summary.count)), worker_id}, "worker not registered");
}

// ------------------------------------------------------------------
// Worker locations
// ------------------------------------------------------------------

Result SqlRepository::AppendWorkerLocation(Transaction& t, const model::WorkerLocationRecord& r) {
  return Execute(t, INSERT_WORKER_LOCATION,
                 {r.worker_id, r.lat, r.lng, r.heading, r.speed, r.accuracy, Bool(r.online), Bool(r.available), r.captured_at_ms});
}

std::vector<model::WorkerLocationRecord> SqlRepository::LatestWorkerLocations(Transaction& t, uint64_t since_ms) {
  std::vector<model::WorkerLocationRecord> out;
  Query(t, SELECT_LATEST_WORKER_LOCATIONS, {since_ms}, [&](const Row& row) { out.push_back(ReadLocation(row)); });
  return out;
}

std::optional<model::WorkerLocationRecord> SqlRepository::LatestWorkerLocation(Transaction& t, const std::string& worker_id) {
  std::optional<model::WorkerLocationRecord> out;
  Query(t, SELECT_LATEST_WORKER_LOCATION, {worker_id}, [&](const Row& row) { out = ReadLocation(row); });
  return out;
}

Result SqlRepository::PruneWorkerLocations(Transaction& t, uint64_t older_than_ms, uint64_t& deleted) {
  deleted = 0;
  return Execute(t, PRUNE_WORKER_LOCATIONS, {older_than_ms}, &deleted);
}

// ------------------------------------------------------------------
// Share tokens
// ------------------------------------------------------------------

Result SqlRepository::InsertShareToken(Transaction& t, const model::ShareTokenRecord& r) {
  return Execute(t, INSERT_SHARE_TOKEN, {r.token, r.trip_id, r.created_by, r.created_at_ms, r.expires_at_ms, r.revoked_at_ms});
}

std::optional<model::ShareTokenRecord> SqlRepository::GetShareToken(Transaction& t, const std::string& token) {
  std::optional<model::ShareTokenRecord> out;
  Query(t, SELECT_SHARE_TOKEN, {token}, [&](const Row& row) { out = ReadShareToken(row); });
  return out;
}

std::optional<model::ShareTokenRecord> SqlRepository::FindActiveShareToken(Transaction& t, const std::string& trip_id, uint64_t now_ms) {
  std::optional<model::ShareTokenRecord> out;
  Query(t, SELECT_ACTIVE_SHARE_TOKEN, {trip_id, now_ms}, [&](const Row& row) { out = ReadShareToken(row); });
  return out;
}

Result SqlRepository::RevokeShareTokens(Transaction& t, const std::string& trip_id, uint64_t at_ms, uint32_t& revoked) {
  uint64_t affected = 0;
  auto     result   = Execute(t, REVOKE_SHARE_TOKENS, {at_ms, trip_id}, &affected);
  revoked           = static_cast<uint32_t>(affected);
  return result;
}

} // namespace dispatch::db::sql
