#include "internal/matching/batch_dispatcher.hpp"

#include <optional>

#include "internal/db/api/result_check.hpp"
#include "internal/matching/offer_timer.hpp"
#include "internal/notify/events.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::matching {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_OFFER_CREATED;
using dispatch::events::v1::EVENT_TYPE_OFFER_WITHDRAWN;
using dispatch::events::v1::EVENT_TYPE_TRIP_CANCELLED;

const char* ToString(DispatchStep step) {
  switch (step) {
    case DispatchStep::kOffered:
      return "offered";
    case DispatchStep::kExhausted:
      return "exhausted";
    case DispatchStep::kSkipped:
      return "skipped";
  }
  return "unknown";
}

BatchDispatcher::BatchDispatcher(std::shared_ptr<db::Repository> repository, std::shared_ptr<CandidateSelector> selector,
                                 std::shared_ptr<lifecycle::TripLifecycle> lifecycle, std::shared_ptr<payment::HoldCoordinator> holds,
                                 std::shared_ptr<notify::Notifier> notifier, config::DispatchSettings settings, util::RetryPolicy retry,
                                 util::NowFn now)
    : repository_(std::move(repository)),
      selector_(std::move(selector)),
      lifecycle_(std::move(lifecycle)),
      holds_(std::move(holds)),
      notifier_(std::move(notifier)),
      settings_(settings),
      retry_(retry),
      now_(std::move(now)) {
}

void BatchDispatcher::AttachTimer(std::shared_ptr<OfferTimer> timer) {
  std::lock_guard lock(timer_mutex_);
  timer_ = std::move(timer);
}

DispatchStep BatchDispatcher::Start(const std::string& trip_id) {
  std::optional<db::model::TripRecord> trip;
  {
    auto tx = repository_->Begin();
    trip    = repository_->GetTrip(*tx, trip_id);
    tx->Commit();
  }
  if (!trip) {
    throw util::NotFound("trip " + trip_id + " not found");
  }
  return Advance(trip_id, trip->dispatch_batch);
}

DispatchStep BatchDispatcher::Advance(const std::string& trip_id, uint32_t from_batch) {
  observability::SpanScope span("dispatch.advance");
  span.SetAttribute("trip.id", trip_id);
  span.SetAttribute("dispatch.from_batch", static_cast<int64_t>(from_batch));

  struct Issued {
    std::vector<db::model::OfferRecord> offers;
    db::model::TripRecord               trip;
    uint64_t                            expires_at_ms = 0;
  };

  std::optional<Issued> issued;
  std::optional<db::model::TripRecord> exhausted;

  const auto step = util::RetryOnConflict(retry_, "dispatch.advance", [&] {
    issued.reset();
    exhausted.reset();

    std::optional<db::model::TripRecord> snapshot;
    {
      auto tx  = repository_->Begin();
      snapshot = repository_->GetTrip(*tx, trip_id);
      tx->Commit();
    }
    if (!snapshot || snapshot->status != TRIP_STATUS_SEARCHING || !snapshot->worker_id.empty() || snapshot->dispatch_batch != from_batch) {
      return DispatchStep::kSkipped;
    }

    uint32_t                level = snapshot->escalation_level;
    std::vector<Candidate>  batch;
    if (snapshot->dispatch_batch < settings_.max_batches) {
      for (;;) {
        auto selection = selector_->Select(*snapshot, level);
        if (!selection.batches.empty()) {
          batch = std::move(selection.batches.front());
          break;
        }
        if (level >= settings_.max_escalations) {
          break;
        }
        ++level;
      }
    }

    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip || trip->version != snapshot->version) {
      throw db::TransactionConflict("trip " + trip_id + " changed during candidate selection");
    }
    trip->escalation_level = level;

    if (batch.empty()) {
      auto result = Exhaust(*tx, *trip);
      tx->Commit();
      exhausted = std::move(trip);
      return result;
    }

    const auto now_ms     = util::ToUnixMillis(now_());
    const auto expires_ms = now_ms + static_cast<uint64_t>(settings_.offer_window.count());

    Issued out;
    for (const auto& candidate : batch) {
      db::model::OfferRecord offer;
      offer.id            = util::NewId();
      offer.trip_id       = trip_id;
      offer.worker_id     = candidate.worker_id;
      offer.status        = OFFER_STATUS_PENDING;
      offer.batch_number  = from_batch + 1;
      offer.distance_km   = candidate.distance_km;
      offer.eta_minutes   = candidate.eta_minutes;
      offer.sent_at_ms    = now_ms;
      offer.expires_at_ms = expires_ms;

      const auto result = repository_->InsertOffer(*tx, offer);
      if (result.code == db::ErrorCode::AlreadyExists) {
        continue;
      }
      db::ThrowIfDbError(result, "insert offer");
      out.offers.push_back(std::move(offer));
    }

    trip->dispatch_batch = from_batch + 1;
    lifecycle_->Persist(*tx, *trip);
    tx->Commit();

    out.trip          = std::move(*trip);
    out.expires_at_ms = expires_ms;
    issued            = std::move(out);
    return DispatchStep::kOffered;
  });

  if (exhausted) {
    notifier_->Publish(exhausted->requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_CANCELLED, *exhausted, now_(), "no_match"));
    observability::Metrics::Instance().RecordDispatchOutcome(observability::DispatchOutcome::kNoMatch, exhausted->service_type);
    DISPATCH_LOG_INFO("no worker matched; trip cancelled",
                      {observability::StringField("trip_id", trip_id), observability::IntField("batches", exhausted->dispatch_batch),
                       observability::IntField("escalation_level", exhausted->escalation_level)});
  }

  if (issued) {
    for (const auto& offer : issued->offers) {
      notifier_->Publish(offer.worker_id, notify::MakeOfferEvent(EVENT_TYPE_OFFER_CREATED, offer, now_()));
    }
    observability::Metrics::Instance().RecordOffersIssued(issued->offers.size(), issued->trip.dispatch_batch);
    DISPATCH_LOG_INFO("offer batch issued", {observability::StringField("trip_id", trip_id), observability::IntField("batch", issued->trip.dispatch_batch),
                                             observability::IntField("offers", static_cast<int64_t>(issued->offers.size())),
                                             observability::IntField("escalation_level", issued->trip.escalation_level)});

    std::shared_ptr<OfferTimer> timer;
    {
      std::lock_guard lock(timer_mutex_);
      timer = timer_;
    }
    if (timer) {
      timer->Schedule(trip_id, util::FromUnixMillis(issued->expires_at_ms));
    }
  }

  span.SetAttribute("dispatch.step", ToString(step));
  return step;
}

DispatchStep BatchDispatcher::Exhaust(db::Transaction& tx, db::model::TripRecord& trip) {
  trip.cancellation_reason = CANCELLATION_REASON_NO_MATCH;
  trip.cancellation_note   = "no worker accepted after " + std::to_string(trip.dispatch_batch) + " batches";
  lifecycle_->Transition(tx, trip, TRIP_STATUS_CANCELLED, lifecycle::SystemActor(trip.cancellation_note));
  holds_->ReleaseHold(tx, trip);
  return DispatchStep::kExhausted;
}

DispatchStep BatchDispatcher::Reconcile(const std::string& trip_id) {
  std::vector<db::model::OfferRecord> expired;
  std::optional<db::model::TripRecord> trip;
  bool                                 open_offers = false;

  util::RetryOnConflict(retry_, "dispatch.reconcile", [&] {
    expired.clear();

    auto tx = repository_->Begin();
    trip    = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      tx->Rollback();
      return;
    }

    db::PendingOfferFilter filter;
    filter.trip_id       = trip_id;
    filter.expired_at_ms = util::ToUnixMillis(now_());
    db::ThrowIfDbError(repository_->ResolvePendingOffers(*tx, filter, OFFER_STATUS_EXPIRED, *filter.expired_at_ms, "expired", expired),
                       "expire offers");

    open_offers = false;
    for (const auto& offer : repository_->ListOffersForTrip(*tx, trip_id)) {
      if (offer.status == OFFER_STATUS_PENDING) {
        open_offers = true;
        break;
      }
    }
    tx->Commit();
  });

  if (!trip) {
    return DispatchStep::kSkipped;
  }

  NotifyWithdrawn(expired, "expired");

  if (trip->status != TRIP_STATUS_SEARCHING || !trip->worker_id.empty() || open_offers) {
    return DispatchStep::kSkipped;
  }
  return Advance(trip_id, trip->dispatch_batch);
}

SweepSummary BatchDispatcher::Sweep() {
  std::vector<db::model::TripRecord> searching;
  {
    auto tx   = repository_->Begin();
    searching = repository_->ListTripsByStatus(*tx, TRIP_STATUS_SEARCHING);
    tx->Commit();
  }

  SweepSummary summary;
  for (const auto& trip : searching) {
    ++summary.trips;
    try {
      if (Reconcile(trip.id) != DispatchStep::kSkipped) {
        ++summary.advanced;
      }
    } catch (const std::exception& e) {
      ++summary.failed;
      DISPATCH_LOG_ERROR("dispatch sweep failed for trip", {observability::StringField("trip_id", trip.id), observability::StringField("error", e.what())});
    }
  }
  return summary;
}

std::vector<db::model::OfferRecord> BatchDispatcher::WithdrawOffers(db::Transaction& tx, const std::string& trip_id, const std::string& reason) {
  db::PendingOfferFilter filter;
  filter.trip_id = trip_id;

  std::vector<db::model::OfferRecord> withdrawn;
  db::ThrowIfDbError(repository_->ResolvePendingOffers(tx, filter, OFFER_STATUS_CANCELLED, util::ToUnixMillis(now_()), reason, withdrawn),
                     "withdraw offers");
  return withdrawn;
}

void BatchDispatcher::NotifyWithdrawn(const std::vector<db::model::OfferRecord>& offers, const std::string& reason) {
  for (const auto& offer : offers) {
    notifier_->Publish(offer.worker_id, notify::MakeOfferEvent(EVENT_TYPE_OFFER_WITHDRAWN, offer, now_(), reason));
  }
}

} // namespace dispatch::matching
