#include "internal/matching/response_arbiter.hpp"

#include <optional>
#include <vector>

#include "internal/db/api/result_check.hpp"
#include "internal/notify/events.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::matching {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_OFFER_WITHDRAWN;
using dispatch::events::v1::EVENT_TYPE_TRIP_ASSIGNED;

namespace {

bool CanServe(const db::model::WorkerRecord& worker, const db::model::TripRecord& trip) {
  if (!worker.eligible || !worker.Serves(trip.service_type)) {
    return false;
  }
  return trip.vehicle_type == VEHICLE_TYPE_UNSPECIFIED || worker.vehicle_type == trip.vehicle_type;
}

} // namespace

ResponseArbiter::ResponseArbiter(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                                 std::shared_ptr<notify::Notifier> notifier, util::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)),
      lifecycle_(std::move(lifecycle)),
      notifier_(std::move(notifier)),
      retry_(retry),
      now_(std::move(now)) {
}

AcceptOutcome ResponseArbiter::Accept(const std::string& trip_id, const std::string& worker_id) {
  observability::SpanScope span("dispatch.accept");
  span.SetAttribute("trip.id", trip_id);
  span.SetAttribute("worker.id", worker_id);

  std::vector<db::model::OfferRecord> withdrawn;

  auto outcome = util::RetryOnConflict(retry_, "dispatch.accept", [&] {
    withdrawn.clear();

    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }

    auto offer  = repository_->FindOffer(*tx, trip_id, worker_id);
    auto worker = repository_->GetWorker(*tx, worker_id);
    if (!offer || !worker || !CanServe(*worker, *trip)) {
      throw util::IneligibleWorker("worker " + worker_id + " may not accept trip " + trip_id);
    }

    if (!trip->worker_id.empty()) {
      if (trip->worker_id != worker_id) {
        throw util::AlreadyAssigned("trip " + trip_id + " is already assigned");
      }
      tx->Rollback();
      return AcceptOutcome{*offer, *trip, true};
    }

    if (trip->status != TRIP_STATUS_SEARCHING) {
      throw util::OfferExpired("trip " + trip_id + " is no longer searching");
    }
    if (offer->status != OFFER_STATUS_PENDING) {
      throw util::OfferExpired("offer " + offer->id + " is " + OfferStatus_Name(offer->status));
    }

    const auto now_ms = util::ToUnixMillis(now_());
    if (now_ms >= offer->expires_at_ms) {
      const auto expired = repository_->ResolveOffer(*tx, offer->id, OFFER_STATUS_PENDING, OFFER_STATUS_EXPIRED, now_ms, "expired");
      if (expired) {
        tx->Commit();
      }
      throw util::OfferExpired("offer " + offer->id + " window elapsed");
    }

    const auto bound = repository_->BindWorker(*tx, trip_id, worker_id);
    if (bound.code == db::ErrorCode::Conflict) {
      throw util::AlreadyAssigned("trip " + trip_id + " is already assigned");
    }
    db::ThrowIfDbError(bound, "bind worker");

    db::ThrowIfDbError(repository_->ResolveOffer(*tx, offer->id, OFFER_STATUS_PENDING, OFFER_STATUS_ACCEPTED, now_ms, {}), "accept offer");
    offer->status          = OFFER_STATUS_ACCEPTED;
    offer->responded_at_ms = now_ms;

    // BindWorker moved the version
    trip = repository_->GetTrip(*tx, trip_id);

    lifecycle::TransitionContext ctx;
    ctx.actor_id   = worker_id;
    ctx.actor_role = USER_ROLE_WORKER;
    lifecycle_->Transition(*tx, *trip, TRIP_STATUS_ASSIGNED, ctx);

    db::PendingOfferFilter others;
    others.trip_id         = trip_id;
    others.except_offer_id = offer->id;
    db::ThrowIfDbError(repository_->ResolvePendingOffers(*tx, others, OFFER_STATUS_CANCELLED, now_ms, "accepted_by_another_worker", withdrawn),
                       "cancel competing offers");

    tx->Commit();
    return AcceptOutcome{*offer, *trip, false};
  });

  if (outcome.replayed) {
    return outcome;
  }

  const auto now = now_();
  notifier_->Publish(outcome.trip.requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_ASSIGNED, outcome.trip, now));
  notifier_->Publish(worker_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_ASSIGNED, outcome.trip, now));
  for (const auto& offer : withdrawn) {
    notifier_->Publish(offer.worker_id, notify::MakeOfferEvent(EVENT_TYPE_OFFER_WITHDRAWN, offer, now, "accepted_by_another_worker"));
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordDispatchOutcome(observability::DispatchOutcome::kMatched, outcome.trip.service_type);
  if (outcome.trip.searching_at_ms != 0 && outcome.trip.assigned_at_ms >= outcome.trip.searching_at_ms) {
    metrics.ObserveTimeToMatchMs(static_cast<double>(outcome.trip.assigned_at_ms - outcome.trip.searching_at_ms), outcome.trip.service_type);
  }

  DISPATCH_LOG_INFO("trip assigned", {observability::StringField("trip_id", trip_id), observability::StringField("worker_id", worker_id),
                                      observability::IntField("batch", outcome.offer.batch_number),
                                      observability::IntField("withdrawn", static_cast<int64_t>(withdrawn.size()))});
  return outcome;
}

db::model::OfferRecord ResponseArbiter::Decline(const std::string& trip_id, const std::string& worker_id, const std::string& reason) {
  return util::RetryOnConflict(retry_, "dispatch.decline", [&] {
    auto tx    = repository_->Begin();
    auto offer = repository_->FindOffer(*tx, trip_id, worker_id);
    if (!offer) {
      throw util::NotFound("no offer of trip " + trip_id + " for worker " + worker_id);
    }
    if (offer->status != OFFER_STATUS_PENDING) {
      tx->Rollback();
      return *offer;
    }

    const auto now_ms = util::ToUnixMillis(now_());
    const auto result = repository_->ResolveOffer(*tx, offer->id, OFFER_STATUS_PENDING, OFFER_STATUS_DECLINED, now_ms, reason);
    if (result.code == db::ErrorCode::Conflict) {
      // resolved concurrently; the replay returns it as it now stands
      throw db::TransactionConflict("offer " + offer->id + " resolved concurrently");
    }
    db::ThrowIfDbError(result, "decline offer");
    tx->Commit();

    offer->status          = OFFER_STATUS_DECLINED;
    offer->responded_at_ms = now_ms;
    offer->reason          = reason;

    DISPATCH_LOG_INFO("offer declined", {observability::StringField("trip_id", trip_id), observability::StringField("worker_id", worker_id)});
    return *offer;
  });
}

} // namespace dispatch::matching
