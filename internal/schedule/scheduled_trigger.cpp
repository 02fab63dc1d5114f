#include "internal/schedule/scheduled_trigger.hpp"

#include <optional>
#include <vector>

#include "internal/db/api/result_check.hpp"
#include "internal/matching/batch_dispatcher.hpp"
#include "internal/notify/events.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::schedule {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_TRIP_CANCELLED;
using dispatch::events::v1::EVENT_TYPE_TRIP_STATUS_CHANGED;

ScheduledTrigger::ScheduledTrigger(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                                   std::shared_ptr<payment::HoldCoordinator> holds, std::shared_ptr<matching::BatchDispatcher> dispatcher,
                                   std::shared_ptr<notify::Notifier> notifier, util::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)),
      lifecycle_(std::move(lifecycle)),
      holds_(std::move(holds)),
      dispatcher_(std::move(dispatcher)),
      notifier_(std::move(notifier)),
      retry_(retry),
      now_(std::move(now)) {
}

TriggerSummary ScheduledTrigger::RunOnce() {
  std::vector<db::model::TripRecord> due;
  {
    auto tx = repository_->Begin();
    due     = repository_->ListDueScheduledTrips(*tx, util::ToUnixMillis(now_()));
    tx->Commit();
  }

  TriggerSummary summary;
  summary.due = static_cast<uint32_t>(due.size());

  for (const auto& trip : due) {
    try {
      switch (Promote(trip.id)) {
        case Outcome::kPromoted:
          ++summary.promoted;
          break;
        case Outcome::kCancelled:
          ++summary.cancelled;
          break;
        case Outcome::kSkipped:
          break;
      }
    } catch (const std::exception& e) {
      ++summary.failed;
      DISPATCH_LOG_ERROR("scheduled trip promotion failed", {observability::StringField("trip_id", trip.id), observability::StringField("error", e.what())});
    }
  }

  if (summary.due > 0) {
    DISPATCH_LOG_INFO("scheduled trips processed", {observability::IntField("due", summary.due), observability::IntField("promoted", summary.promoted),
                                                    observability::IntField("cancelled", summary.cancelled), observability::IntField("failed", summary.failed)});
  }
  return summary;
}

ScheduledTrigger::Outcome ScheduledTrigger::Promote(const std::string& trip_id) {
  std::optional<db::model::TripRecord> result;

  const auto outcome = util::RetryOnConflict(retry_, "schedule.promote", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip || trip->status != TRIP_STATUS_SCHEDULED) {
      tx->Rollback();
      return Outcome::kSkipped;
    }

    db::ThrowIfDbError(repository_->LockAccount(*tx, trip->requester_id), "lock account");

    if (!repository_->ListActiveTripsForRequester(*tx, trip->requester_id).empty()) {
      trip->cancellation_reason = CANCELLATION_REASON_SCHEDULE_CONFLICT;
      trip->cancellation_note   = "requester already has an active trip at the scheduled time";
      lifecycle_->Transition(*tx, *trip, TRIP_STATUS_CANCELLED, lifecycle::SystemActor(trip->cancellation_note));
      holds_->ReleaseHold(*tx, *trip);
      tx->Commit();
      result = std::move(trip);
      return Outcome::kCancelled;
    }

    lifecycle_->Transition(*tx, *trip, TRIP_STATUS_SEARCHING, lifecycle::SystemActor("scheduled time reached"));
    tx->Commit();
    result = std::move(trip);
    return Outcome::kPromoted;
  });

  if (outcome == Outcome::kCancelled) {
    notifier_->Publish(result->requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_CANCELLED, *result, now_(), "schedule_conflict"));
    observability::Metrics::Instance().RecordDispatchOutcome(observability::DispatchOutcome::kCancelled, result->service_type);
  } else if (outcome == Outcome::kPromoted) {
    notifier_->Publish(result->requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_STATUS_CHANGED, *result, now_()));
    try {
      dispatcher_->Start(trip_id);
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("first batch left to the dispatch sweep", {observability::StringField("trip_id", trip_id), observability::StringField("error", e.what())});
    }
  }
  return outcome;
}

} // namespace dispatch::schedule
