#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace dispatch::notify {
class Notifier;
}

namespace dispatch::payment {
class HoldCoordinator;
}

namespace dispatch::matching {

class OfferTimer;

enum class DispatchStep {
  kOffered,   // a new batch of offers is out
  kExhausted, // trip cancelled with NO_MATCH, hold refunded
  kSkipped,   // trip no longer searching, or another caller advanced it
};

const char* ToString(DispatchStep step);

struct SweepSummary {
  uint32_t trips    = 0;
  uint32_t advanced = 0;
  uint32_t failed   = 0;
};

/*
  Drives one trip through idle -> batch 1 -> batch 2 -> ... until a
  worker accepts or the batches run out.

  Every step is a conditional unit of work against the store:
  - Advance only acts while the trip is searching, unbound and still at
    the batch the caller observed; anything else is a no-op.
  - Selection runs outside any transaction; the write phase re-reads
    the trip and replays when its version moved (a cancel or accept
    won the race).
  - Reconcile is idempotent: expiring an already resolved offer is a
    no-op, so the timer and the sweep may both run it.
*/
class BatchDispatcher {
 public:
  BatchDispatcher(std::shared_ptr<db::Repository> repository, std::shared_ptr<CandidateSelector> selector,
                  std::shared_ptr<lifecycle::TripLifecycle> lifecycle, std::shared_ptr<payment::HoldCoordinator> holds,
                  std::shared_ptr<notify::Notifier> notifier, config::DispatchSettings settings, util::RetryPolicy retry,
                  util::NowFn now = util::Now);

  // Offer windows are reported here when set.
  void AttachTimer(std::shared_ptr<OfferTimer> timer);

  // First batch (or the next one after a reassignment).
  DispatchStep Start(const std::string& trip_id);

  DispatchStep Advance(const std::string& trip_id, uint32_t from_batch);

  // Expires overdue offers; advances when the trip has none left open.
  DispatchStep Reconcile(const std::string& trip_id);

  // Reconcile for every searching trip.
  SweepSummary Sweep();

  // Cancels every pending offer of the trip inside tx; returns them so
  // the caller can notify once committed.
  std::vector<db::model::OfferRecord> WithdrawOffers(db::Transaction& tx, const std::string& trip_id, const std::string& reason);

  void NotifyWithdrawn(const std::vector<db::model::OfferRecord>& offers, const std::string& reason);

 private:
  DispatchStep Exhaust(db::Transaction& tx, db::model::TripRecord& trip);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<CandidateSelector>        selector_;
  std::shared_ptr<lifecycle::TripLifecycle> lifecycle_;
  std::shared_ptr<payment::HoldCoordinator> holds_;
  std::shared_ptr<notify::Notifier>         notifier_;
  config::DispatchSettings                  settings_;
  util::RetryPolicy                         retry_;
  util::NowFn                               now_;

  std::mutex                  timer_mutex_;
  std::shared_ptr<OfferTimer> timer_;
};

} // namespace dispatch::matching
