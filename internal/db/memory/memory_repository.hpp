#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace dispatch::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

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

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TripRecord> trips;
    std::vector<model::StatusChangeRecord>             status_changes;

    // ordered by id so listings are deterministic
    std::map<std::string, model::OfferRecord>  offers;
    std::map<std::string, std::string>         offer_by_trip_worker; // trip#worker -> offer id

    std::vector<model::LedgerEntryRecord> ledger; // append order

    std::map<std::string, model::WorkerRecord>  workers;
    std::vector<model::WorkerLocationRecord>    locations;
    std::map<std::string, model::ShareTokenRecord> share_tokens;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace dispatch::db::memory
