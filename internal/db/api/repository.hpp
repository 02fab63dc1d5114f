#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/share_token_record.hpp"
#include "internal/db/model/status_change_record.hpp"
#include "internal/db/model/trip_record.hpp"
#include "internal/db/model/worker_location_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace dispatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (UpdateTrip, BindWorker, ReleaseWorker,
    ResolveOffer) return ErrorCode::Conflict when no row matched;
    the caller decides whether that is a lost race or a retry
  - A requester has at most one trip in an active status
  - A hold is settled by at most one ledger row

  The DB is the source of truth for:
    trips and their status history
    dispatch offers
    the wallet ledger
    worker eligibility and positions
*/

// Selects still-pending offers of one trip for ResolvePendingOffers.
struct PendingOfferFilter {
  std::string trip_id;

  // only offers with expires_at_ms <= this value
  std::optional<uint64_t> expired_at_ms;

  // spare this offer (the accepted one)
  std::string except_offer_id;
};

struct RatingSummary {
  double   average = 0;
  uint32_t count   = 0;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Trips
  // ---------------------------------------------------------------------

  // ConstraintViolation when the requester already has an active trip.
  virtual Result InsertTrip(Transaction&, const model::TripRecord&) = 0;

  virtual std::optional<model::TripRecord> GetTrip(Transaction&, const std::string& id) = 0;

  // Writes every column except worker_id, only if version == expected_version.
  // The stored version becomes expected_version + 1.
  virtual Result UpdateTrip(Transaction&, const model::TripRecord&, uint64_t expected_version) = 0;

  // Binds only if the trip is searching and has no worker. Bumps version.
  virtual Result BindWorker(Transaction&, const std::string& trip_id, const std::string& worker_id) = 0;

  // Clears the binding only if worker_id is the bound worker. Bumps version.
  virtual Result ReleaseWorker(Transaction&, const std::string& trip_id, const std::string& worker_id) = 0;

  virtual std::vector<model::TripRecord> ListActiveTripsForRequester(Transaction&, const std::string& requester_id) = 0;

  virtual std::vector<model::TripRecord> ListActiveTripsForWorker(Transaction&, const std::string& worker_id) = 0;

  virtual std::vector<model::TripRecord> ListTripsByStatus(Transaction&, dispatch::core::v1::TripStatus status) = 0;

  // Scheduled trips with scheduled_at_ms <= now_ms, oldest first.
  virtual std::vector<model::TripRecord> ListDueScheduledTrips(Transaction&, uint64_t now_ms) = 0;

  virtual Result AppendStatusChange(Transaction&, const model::StatusChangeRecord&) = 0;

  virtual std::vector<model::StatusChangeRecord> ListStatusChanges(Transaction&, const std::string& trip_id) = 0;

  // ---------------------------------------------------------------------
  // Dispatch offers
  // ---------------------------------------------------------------------

  // AlreadyExists when the worker was already offered this trip.
  virtual Result InsertOffer(Transaction&, const model::OfferRecord&) = 0;

  virtual std::optional<model::OfferRecord> GetOffer(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::OfferRecord> FindOffer(Transaction&, const std::string& trip_id, const std::string& worker_id) = 0;

  virtual std::vector<model::OfferRecord> ListOffersForTrip(Transaction&, const std::string& trip_id) = 0;

  virtual std::vector<model::OfferRecord> ListPendingOffersForWorker(Transaction&, const std::string& worker_id) = 0;

  // Pending offers of the worker on trips other than exclude_trip_id.
  virtual uint32_t CountPendingOffersForWorker(Transaction&, const std::string& worker_id, const std::string& exclude_trip_id) = 0;

  virtual std::vector<model::OfferRecord> ListExpiredPendingOffers(Transaction&, uint64_t now_ms) = 0;

  // Moves one offer out of expected_status. Conflict when it already left it.
  virtual Result ResolveOffer(Transaction&, const std::string& offer_id, dispatch::core::v1::OfferStatus expected_status,
                              dispatch::core::v1::OfferStatus to, uint64_t at_ms, const std::string& reason) = 0;

  // Resolves every pending offer matching the filter; the rows as they
  // were resolved are appended to `resolved`.
  virtual Result ResolvePendingOffers(Transaction&, const PendingOfferFilter& filter, dispatch::core::v1::OfferStatus to, uint64_t at_ms,
                                      const std::string& reason, std::vector<model::OfferRecord>& resolved) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  // Serializes balance check + insert for one account until commit.
  virtual Result LockAccount(Transaction&, const std::string& account_id) = 0;

  // ConstraintViolation when settles_entry_id is already settled.
  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& account_id) = 0;

  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntriesForTrip(Transaction&, const std::string& trip_id) = 0;

  // The row settling hold_id, if any.
  virtual std::optional<model::LedgerEntryRecord> FindSettlement(Transaction&, const std::string& hold_id) = 0;

  // credit + refund - debit - unsettled hold, over completed entries
  virtual int64_t AvailableBalance(Transaction&, const std::string& account_id) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  virtual Result UpsertWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&) = 0;

  // Mean worker_rating over the worker's rated trips.
  virtual RatingSummary SummarizeWorkerRatings(Transaction&, const std::string& worker_id) = 0;

  // Conflict when the worker has no row.
  virtual Result SetWorkerRating(Transaction&, const std::string& worker_id, const RatingSummary& summary) = 0;

  // ---------------------------------------------------------------------
  // Worker locations
  // ---------------------------------------------------------------------

  virtual Result AppendWorkerLocation(Transaction&, const model::WorkerLocationRecord&) = 0;

  // Latest row per worker, restricted to rows captured at or after since_ms.
  virtual std::vector<model::WorkerLocationRecord> LatestWorkerLocations(Transaction&, uint64_t since_ms) = 0;

  virtual std::optional<model::WorkerLocationRecord> LatestWorkerLocation(Transaction&, const std::string& worker_id) = 0;

  // Deletes rows older than older_than_ms except each worker's latest.
  virtual Result PruneWorkerLocations(Transaction&, uint64_t older_than_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Share tokens
  // ---------------------------------------------------------------------

  virtual Result InsertShareToken(Transaction&, const model::ShareTokenRecord&) = 0;

  virtual std::optional<model::ShareTokenRecord> GetShareToken(Transaction&, const std::string& token) = 0;

  // Unrevoked token of the trip with expires_at_ms > now_ms.
  virtual std::optional<model::ShareTokenRecord> FindActiveShareToken(Transaction&, const std::string& trip_id, uint64_t now_ms) = 0;

  virtual Result RevokeShareTokens(Transaction&, const std::string& trip_id, uint64_t at_ms, uint32_t& revoked) = 0;
};

} // namespace dispatch::db
