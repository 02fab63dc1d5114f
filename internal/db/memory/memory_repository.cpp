#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/model/trip_state_machine.hpp"
#include "memory_tx.hpp"

namespace dispatch::db::memory {

using dispatch::core::v1::LEDGER_ENTRY_STATUS_COMPLETED;
using dispatch::core::v1::LEDGER_ENTRY_TYPE_CREDIT;
using dispatch::core::v1::LEDGER_ENTRY_TYPE_DEBIT;
using dispatch::core::v1::LEDGER_ENTRY_TYPE_HOLD;
using dispatch::core::v1::LEDGER_ENTRY_TYPE_REFUND;
using dispatch::core::v1::OFFER_STATUS_PENDING;
using dispatch::core::v1::TRIP_STATUS_SCHEDULED;
using dispatch::core::v1::TRIP_STATUS_SEARCHING;

namespace {

std::string OfferKey(const std::string& trip_id, const std::string& worker_id) {
  return trip_id + "#" + worker_id;
}

bool HasOtherActiveTrip(const std::unordered_map<std::string, model::TripRecord>& trips, const model::TripRecord& r) {
  if (!::dispatch::model::IsActive(r.status)) {
    return false;
  }
  for (const auto& [id, trip] : trips) {
    if (id != r.id && trip.requester_id == r.requester_id && ::dispatch::model::IsActive(trip.status)) {
      return true;
    }
  }
  return false;
}

template <typename Pred>
std::vector<model::TripRecord> CollectTrips(const std::unordered_map<std::string, model::TripRecord>& trips, Pred pred) {
  std::vector<model::TripRecord> out;
  for (const auto& [_, trip] : trips) {
    if (pred(trip)) out.push_back(trip);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Trips
// ------------------------------------------------------------------

Result MemoryRepository::InsertTrip(Transaction& t, const model::TripRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.trips.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (HasOtherActiveTrip(s.trips, r)) return Result::Err(ErrorCode::ConstraintViolation, "requester has an active trip");
  s.trips[r.id] = r;
  return Result::Ok();
}

std::optional<model::TripRecord> MemoryRepository::GetTrip(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.trips.find(id);
  if (it == s.trips.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTrip(Transaction& t, const model::TripRecord& r, uint64_t expected_version) {
  const auto& view = TX(t).View();
  auto        it   = view.trips.find(r.id);
  if (it == view.trips.end() || it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "trip version changed");
  }
  if (HasOtherActiveTrip(view.trips, r)) return Result::Err(ErrorCode::ConstraintViolation, "requester has an active trip");

  auto& stored     = TX(t).Mutable().trips[r.id];
  auto  worker_id  = stored.worker_id;
  stored           = r;
  stored.worker_id = worker_id;
  stored.version   = expected_version + 1;
  return Result::Ok();
}

Result MemoryRepository::BindWorker(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  const auto& view = TX(t).View();
  auto        it   = view.trips.find(trip_id);
  if (it == view.trips.end() || !it->second.worker_id.empty() || it->second.status != TRIP_STATUS_SEARCHING) {
    return Result::Err(ErrorCode::Conflict, "trip not open for binding");
  }

  auto& stored     = TX(t).Mutable().trips[trip_id];
  stored.worker_id = worker_id;
  stored.version++;
  return Result::Ok();
}

Result MemoryRepository::ReleaseWorker(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  const auto& view = TX(t).View();
  auto        it   = view.trips.find(trip_id);
  if (it == view.trips.end() || it->second.worker_id != worker_id) {
    return Result::Err(ErrorCode::Conflict, "worker not bound to trip");
  }

  auto& stored = TX(t).Mutable().trips[trip_id];
  stored.worker_id.clear();
  stored.version++;
  return Result::Ok();
}

std::vector<model::TripRecord> MemoryRepository::ListActiveTripsForRequester(Transaction& t, const std::string& requester_id) {
  return CollectTrips(TX(t).View().trips,
                      [&](const model::TripRecord& r) { return r.requester_id == requester_id && ::dispatch::model::IsActive(r.status); });
}

std::vector<model::TripRecord> MemoryRepository::ListActiveTripsForWorker(Transaction& t, const std::string& worker_id) {
  return CollectTrips(TX(t).View().trips,
                      [&](const model::TripRecord& r) { return r.worker_id == worker_id && ::dispatch::model::IsActive(r.status); });
}

std::vector<model::TripRecord> MemoryRepository::ListTripsByStatus(Transaction& t, dispatch::core::v1::TripStatus status) {
  return CollectTrips(TX(t).View().trips, [&](const model::TripRecord& r) { return r.status == status; });
}

std::vector<model::TripRecord> MemoryRepository::ListDueScheduledTrips(Transaction& t, uint64_t now_ms) {
  auto out = CollectTrips(TX(t).View().trips,
                          [&](const model::TripRecord& r) { return r.status == TRIP_STATUS_SCHEDULED && r.scheduled_at_ms <= now_ms; });
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.scheduled_at_ms < b.scheduled_at_ms; });
  return out;
}

Result MemoryRepository::AppendStatusChange(Transaction& t, const model::StatusChangeRecord& r) {
  TX(t).Mutable().status_changes.push_back(r);
  return Result::Ok();
}

std::vector<model::StatusChangeRecord> MemoryRepository::ListStatusChanges(Transaction& t, const std::string& trip_id) {
  std::vector<model::StatusChangeRecord> out;
  for (const auto& e : TX(t).View().status_changes)
    if (e.trip_id == trip_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result MemoryRepository::InsertOffer(Transaction& t, const model::OfferRecord& r) {
  const auto& view = TX(t).View();
  if (view.offers.contains(r.id) || view.offer_by_trip_worker.contains(OfferKey(r.trip_id, r.worker_id))) {
    return Result::Err(ErrorCode::AlreadyExists, "worker already offered this trip");
  }

  auto& s                                             = TX(t).Mutable();
  s.offers[r.id]                                      = r;
  s.offer_by_trip_worker[OfferKey(r.trip_id, r.worker_id)] = r.id;
  return Result::Ok();
}

std::optional<model::OfferRecord> MemoryRepository::GetOffer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.offers.find(id);
  if (it == s.offers.end()) return std::nullopt;
  return it->second;
}

std::optional<model::OfferRecord> MemoryRepository::FindOffer(Transaction& t, const std::string& trip_id, const std::string& worker_id) {
  const auto& s  = TX(t).View();
  auto        it = s.offer_by_trip_worker.find(OfferKey(trip_id, worker_id));
  if (it == s.offer_by_trip_worker.end()) return std::nullopt;
  return s.offers.at(it->second);
}

std::vector<model::OfferRecord> MemoryRepository::ListOffersForTrip(Transaction& t, const std::string& trip_id) {
  std::vector<model::OfferRecord> out;
  for (const auto& [_, offer] : TX(t).View().offers)
    if (offer.trip_id == trip_id) out.push_back(offer);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.batch_number < b.batch_number; });
  return out;
}

std::vector<model::OfferRecord> MemoryRepository::ListPendingOffersForWorker(Transaction& t, const std::string& worker_id) {
  std::vector<model::OfferRecord> out;
  for (const auto& [_, offer] : TX(t).View().offers)
    if (offer.worker_id == worker_id && offer.status == OFFER_STATUS_PENDING) out.push_back(offer);
  return out;
}

uint32_t MemoryRepository::CountPendingOffersForWorker(Transaction& t, const std::string& worker_id, const std::string& exclude_trip_id) {
  uint32_t count = 0;
  for (const auto& [_, offer] : TX(t).View().offers)
    if (offer.worker_id == worker_id && offer.status == OFFER_STATUS_PENDING && offer.trip_id != exclude_trip_id) ++count;
  return count;
}

std::vector<model::OfferRecord> MemoryRepository::ListExpiredPendingOffers(Transaction& t, uint64_t now_ms) {
  std::vector<model::OfferRecord> out;
  for (const auto& [_, offer] : TX(t).View().offers)
    if (offer.status == OFFER_STATUS_PENDING && offer.expires_at_ms <= now_ms) out.push_back(offer);
  return out;
}

Result MemoryRepository::ResolveOffer(Transaction& t, const std::string& offer_id, dispatch::core::v1::OfferStatus expected_status,
                                      dispatch::core::v1::OfferStatus to, uint64_t at_ms, const std::string& reason) {
  const auto& view = TX(t).View();
  auto        it   = view.offers.find(offer_id);
  if (it == view.offers.end() || it->second.status != expected_status) {
    return Result::Err(ErrorCode::Conflict, "offer already resolved");
  }

  auto& offer           = TX(t).Mutable().offers[offer_id];
  offer.status          = to;
  offer.responded_at_ms = at_ms;
  offer.reason          = reason;
  return Result::Ok();
}

Result MemoryRepository::ResolvePendingOffers(Transaction& t, const PendingOfferFilter& filter, dispatch::core::v1::OfferStatus to,
                                              uint64_t at_ms, const std::string& reason, std::vector<model::OfferRecord>& resolved) {
  std::vector<std::string> ids;
  for (const auto& [id, offer] : TX(t).View().offers) {
    if (offer.trip_id != filter.trip_id || offer.status != OFFER_STATUS_PENDING || id == filter.except_offer_id) continue;
    if (filter.expired_at_ms && offer.expires_at_ms > *filter.expired_at_ms) continue;
    ids.push_back(id);
  }
  if (ids.empty()) return Result::Ok();

  auto& s = TX(t).Mutable();
  for (const auto& id : ids) {
    auto& offer           = s.offers[id];
    offer.status          = to;
    offer.responded_at_ms = at_ms;
    offer.reason          = reason;
    resolved.push_back(offer);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::LockAccount(Transaction&, const std::string&) {
  // the snapshot commit check already serializes writers
  return Result::Ok();
}

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  for (const auto& e : TX(t).View().ledger) {
    if (e.id == r.id) return Result::Err(ErrorCode::AlreadyExists);
    if (!r.settles_entry_id.empty() && e.settles_entry_id == r.settles_entry_id) {
      return Result::Err(ErrorCode::ConstraintViolation, "hold already settled");
    }
  }
  TX(t).Mutable().ledger.push_back(r);
  return Result::Ok();
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  for (const auto& e : TX(t).View().ledger)
    if (e.id == id) return e;
  return std::nullopt;
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const std::string& account_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.account_id == account_id) out.push_back(e);
  return out;
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntriesForTrip(Transaction& t, const std::string& trip_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.trip_id == trip_id) out.push_back(e);
  return out;
}

std::optional<model::LedgerEntryRecord> MemoryRepository::FindSettlement(Transaction& t, const std::string& hold_id) {
  for (const auto& e : TX(t).View().ledger)
    if (e.settles_entry_id == hold_id) return e;
  return std::nullopt;
}

int64_t MemoryRepository::AvailableBalance(Transaction& t, const std::string& account_id) {
  const auto& ledger = TX(t).View().ledger;

  std::unordered_set<std::string> converted; // holds settled by a debit
  for (const auto& e : ledger) {
    if (e.account_id == account_id && e.status == LEDGER_ENTRY_STATUS_COMPLETED && e.type == LEDGER_ENTRY_TYPE_DEBIT && !e.settles_entry_id.empty()) {
      converted.insert(e.settles_entry_id);
    }
  }

  int64_t balance = 0;
  for (const auto& e : ledger) {
    if (e.account_id != account_id || e.status != LEDGER_ENTRY_STATUS_COMPLETED) continue;
    switch (e.type) {
      case LEDGER_ENTRY_TYPE_CREDIT:
      case LEDGER_ENTRY_TYPE_REFUND:
        balance += e.amount;
        break;
      case LEDGER_ENTRY_TYPE_DEBIT:
        balance -= e.amount;
        break;
      case LEDGER_ENTRY_TYPE_HOLD:
        if (!converted.contains(e.id)) balance -= e.amount;
        break;
      default:
        break;
    }
  }
  return balance;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  auto& workers = TX(t).Mutable().workers;
  auto  stored  = r;
  if (auto it = workers.find(r.id); it != workers.end()) {
    stored.rating       = it->second.rating;
    stored.rating_count = it->second.rating_count;
  } else {
    stored.rating       = 0;
    stored.rating_count = 0;
  }
  workers[r.id] = std::move(stored);
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t) {
  std::vector<model::WorkerRecord> out;
  for (const auto& [_, worker] : TX(t).View().workers) out.push_back(worker);
  return out;
}

RatingSummary MemoryRepository::SummarizeWorkerRatings(Transaction& t, const std::string& worker_id) {
  RatingSummary summary;
  uint64_t      total = 0;
  for (const auto& [_, trip] : TX(t).View().trips) {
    if (trip.worker_id == worker_id && trip.worker_rating > 0) {
      total += trip.worker_rating;
      summary.count++;
    }
  }
  if (summary.count > 0) {
    summary.average = static_cast<double>(total) / summary.count;
  }
  return summary;
}

Result MemoryRepository::SetWorkerRating(Transaction& t, const std::string& worker_id, const RatingSummary& summary) {
  if (!TX(t).View().workers.contains(worker_id)) {
    return Result::Err(ErrorCode::Conflict, "worker not registered");
  }
  auto& stored        = TX(t).Mutable().workers[worker_id];
  stored.rating       = summary.average;
  stored.rating_count = summary.count;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Worker locations
// ------------------------------------------------------------------

Result MemoryRepository::AppendWorkerLocation(Transaction& t, const model::WorkerLocationRecord& r) {
  TX(t).Mutable().locations.push_back(r);
  return Result::Ok();
}

std::vector<model::WorkerLocationRecord> MemoryRepository::LatestWorkerLocations(Transaction& t, uint64_t since_ms) {
  std::map<std::string, model::WorkerLocationRecord> latest;
  for (const auto& row : TX(t).View().locations) {
    auto it = latest.find(row.worker_id);
    if (it == latest.end() || row.captured_at_ms >= it->second.captured_at_ms) latest[row.worker_id] = row;
  }

  std::vector<model::WorkerLocationRecord> out;
  for (auto& [_, row] : latest)
    if (row.captured_at_ms >= since_ms) out.push_back(std::move(row));
  return out;
}

std::optional<model::WorkerLocationRecord> MemoryRepository::LatestWorkerLocation(Transaction& t, const std::string& worker_id) {
  std::optional<model::WorkerLocationRecord> latest;
  for (const auto& row : TX(t).View().locations) {
    if (row.worker_id == worker_id && (!latest || row.captured_at_ms >= latest->captured_at_ms)) latest = row;
  }
  return latest;
}

Result MemoryRepository::PruneWorkerLocations(Transaction& t, uint64_t older_than_ms, uint64_t& deleted) {
  const auto& rows = TX(t).View().locations;

  std::unordered_map<std::string, size_t> latest_index;
  for (size_t i = 0; i < rows.size(); ++i) {
    auto it = latest_index.find(rows[i].worker_id);
    if (it == latest_index.end() || rows[i].captured_at_ms >= rows[it->second].captured_at_ms) latest_index[rows[i].worker_id] = i;
  }

  std::vector<model::WorkerLocationRecord> kept;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].captured_at_ms >= older_than_ms || latest_index[rows[i].worker_id] == i) kept.push_back(rows[i]);
  }

  deleted = rows.size() - kept.size();
  if (deleted > 0) TX(t).Mutable().locations = std::move(kept);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Share tokens
// ------------------------------------------------------------------

Result MemoryRepository::InsertShareToken(Transaction& t, const model::ShareTokenRecord& r) {
  if (TX(t).View().share_tokens.contains(r.token)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().share_tokens[r.token] = r;
  return Result::Ok();
}

std::optional<model::ShareTokenRecord> MemoryRepository::GetShareToken(Transaction& t, const std::string& token) {
  const auto& s  = TX(t).View();
  auto        it = s.share_tokens.find(token);
  if (it == s.share_tokens.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ShareTokenRecord> MemoryRepository::FindActiveShareToken(Transaction& t, const std::string& trip_id, uint64_t now_ms) {
  for (const auto& [_, token] : TX(t).View().share_tokens)
    if (token.trip_id == trip_id && token.revoked_at_ms == 0 && token.expires_at_ms > now_ms) return token;
  return std::nullopt;
}

Result MemoryRepository::RevokeShareTokens(Transaction& t, const std::string& trip_id, uint64_t at_ms, uint32_t& revoked) {
  revoked = 0;
  std::vector<std::string> live;
  for (const auto& [key, token] : TX(t).View().share_tokens)
    if (token.trip_id == trip_id && token.revoked_at_ms == 0) live.push_back(key);
  if (live.empty()) return Result::Ok();

  auto& s = TX(t).Mutable();
  for (const auto& key : live) {
    s.share_tokens[key].revoked_at_ms = at_ms;
    ++revoked;
  }
  return Result::Ok();
}

} // namespace dispatch::db::memory
