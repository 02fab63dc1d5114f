#pragma once

#include <functional>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace dispatch::db::sql {

/*
  Repository logic shared by the relational backends.

  Backends supply statement execution over their driver; every query
  comes from sql_queries.hpp so SQLite and Postgres stay in lockstep.

  Execute() reports failures as Result codes. Query() throws:
  TransactionConflict for lock/serialization failures, runtime_error
  otherwise.
*/
class SqlRepository : public db::Repository {
 public:
  Result InsertTrip(Transaction&, const model::TripRecord&) override;
  std::optional<model::TripRecord> GetTrip(Transaction&, const std::string&) override;
  Result UpdateTrip(Transaction&, const model::TripRecord&, uint64_t expected_version) override;
  Result BindWorker(Transaction&, const std::string& trip_id, const std::string& worker_id) override;
  Result ReleaseWorker(Transaction&, const std::string& trip_id, const std::string& worker_id) override;
  std::vector<model::TripRecord> ListActiveTripsForRequester(Transaction&, const std::string&) override;
  std::vector<model::TripRecord> ListActiveTripsForWorker(Transaction&, const std::string&) override;
  std::vector<model::TripRecord> ListTripsByStatus(Transaction&, dispatch::core::v1::TripStatus) override;
  std::vector<model::TripRecord> ListDueScheduledTrips(Transaction&, uint64_t now_ms) override;
  Result AppendStatusChange(Transaction&, const model::StatusChangeRecord&) override;
  std::vector<model::StatusChangeRecord> ListStatusChanges(Transaction&, const std::string&) override;

  Result InsertOffer(Transaction&, const model::OfferRecord&) override;
  std::optional<model::OfferRecord> GetOffer(Transaction&, const std::string&) override;
  std::optional<model::OfferRecord> FindOffer(Transaction&, const std::string& trip_id, const std::string& worker_id) override;
  std::vector<model::OfferRecord> ListOffersForTrip(Transaction&, const std::string&) override;
  std::vector<model::OfferRecord> ListPendingOffersForWorker(Transaction&, const std::string&) override;
  uint32_t CountPendingOffersForWorker(Transaction&, const std::string& worker_id, const std::string& exclude_trip_id) override;
  std::vector<model::OfferRecord> ListExpiredPendingOffers(Transaction&, uint64_t now_ms) override;
  Result ResolveOffer(Transaction&, const std::string& offer_id, dispatch::core::v1::OfferStatus expected_status,
                      dispatch::core::v1::OfferStatus to, uint64_t at_ms, const std::string& reason) override;
  Result ResolvePendingOffers(Transaction&, const PendingOfferFilter& filter, dispatch::core::v1::OfferStatus to, uint64_t at_ms,
                              const std::string& reason, std::vector<model::OfferRecord>& resolved) override;

  Result LockAccount(Transaction&, const std::string&) override;
  Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string&) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string&) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntriesForTrip(Transaction&, const std::string&) override;
  std::optional<model::LedgerEntryRecord> FindSettlement(Transaction&, const std::string&) override;
  int64_t AvailableBalance(Transaction&, const std::string&) override;

  Result UpsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;
  RatingSummary SummarizeWorkerRatings(Transaction&, const std::string& worker_id) override;
  Result SetWorkerRating(Transaction&, const std::string& worker_id, const RatingSummary& summary) override;

  Result AppendWorkerLocation(Transaction&, const model::WorkerLocationRecord&) override;
  std::vector<model::WorkerLocationRecord> LatestWorkerLocations(Transaction&, uint64_t since_ms) override;
  std::optional<model::WorkerLocationRecord> LatestWorkerLocation(Transaction&, const std::string&) override;
  Result PruneWorkerLocations(Transaction&, uint64_t older_than_ms, uint64_t& deleted) override;

  Result InsertShareToken(Transaction&, const model::ShareTokenRecord&) override;
  std::optional<model::ShareTokenRecord> GetShareToken(Transaction&, const std::string&) override;
  std::optional<model::ShareTokenRecord> FindActiveShareToken(Transaction&, const std::string& trip_id, uint64_t now_ms) override;
  Result RevokeShareTokens(Transaction&, const std::string& trip_id, uint64_t at_ms, uint32_t& revoked) override;

 protected:
  using RowFn = std::function<void(const Row&)>;

  // affected (optional) receives the number of changed rows.
  virtual Result Execute(Transaction&, const char* sql, const Params& params, uint64_t* affected = nullptr) = 0;

  virtual void Query(Transaction&, const char* sql, const Params& params, const RowFn& on_row) = 0;

 private:
  std::vector<model::TripRecord>  QueryTrips(Transaction&, const char* sql, const Params& params);
  std::vector<model::OfferRecord> QueryOffers(Transaction&, const char* sql, const Params& params);
  std::vector<model::LedgerEntryRecord> QueryLedger(Transaction&, const char* sql, const Params& params);

  // 0 rows changed -> Conflict
  Result ExecuteConditional(Transaction&, const char* sql, const Params& params, const char* what);
};

} // namespace dispatch::db::sql
