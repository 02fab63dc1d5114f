#include "internal/core/trip_manager.hpp"

#include <algorithm>

#include "internal/db/api/result_check.hpp"
#include "internal/delivery/handoff_code.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/location/location_registry.hpp"
#include "internal/matching/batch_dispatcher.hpp"
#include "internal/matching/response_arbiter.hpp"
#include "internal/model/trip_state_machine.hpp"
#include "internal/notify/events.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::core {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_TRIP_CANCELLED;
using dispatch::events::v1::EVENT_TYPE_TRIP_STATUS_CHANGED;

namespace {

std::optional<db::model::TripRecord> ReadTrip(db::Repository& repository, const std::string& trip_id) {
  auto tx   = repository.Begin();
  auto trip = repository.GetTrip(*tx, trip_id);
  tx->Commit();
  return trip;
}

bool IsWorkerStep(TripStatus status) {
  return status == TRIP_STATUS_ARRIVED_PICKUP || status == TRIP_STATUS_IN_PROGRESS || status == TRIP_STATUS_ARRIVED_DROPOFF ||
         status == TRIP_STATUS_COMPLETED;
}

bool IsShareable(TripStatus status) {
  return status == TRIP_STATUS_ASSIGNED || status == TRIP_STATUS_ARRIVED_PICKUP || status == TRIP_STATUS_IN_PROGRESS ||
         status == TRIP_STATUS_ARRIVED_DROPOFF || status == TRIP_STATUS_COMPLETED;
}

constexpr std::size_t kMaxFeedbackLength = 500;

lifecycle::TransitionContext ActorOf(const Caller& caller, std::string note = {}) {
  lifecycle::TransitionContext ctx;
  ctx.actor_id   = caller.user_id;
  ctx.actor_role = caller.role;
  ctx.note       = std::move(note);
  return ctx;
}

} // namespace

TripManager::TripManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<fare::FareCalculator> fares,
                         std::shared_ptr<payment::HoldCoordinator> holds, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                         std::shared_ptr<matching::BatchDispatcher> dispatcher, std::shared_ptr<matching::ResponseArbiter> arbiter,
                         std::shared_ptr<location::LocationRegistry> registry, std::shared_ptr<notify::Notifier> notifier, config::Settings settings,
                         util::NowFn now)
    : repository_(std::move(repository)),
      fares_(std::move(fares)),
      holds_(std::move(holds)),
      lifecycle_(std::move(lifecycle)),
      dispatcher_(std::move(dispatcher)),
      arbiter_(std::move(arbiter)),
      registry_(std::move(registry)),
      notifier_(std::move(notifier)),
      settings_(std::move(settings)),
      now_(std::move(now)) {
}

uint64_t TripManager::NowMs() const {
  return util::ToUnixMillis(now_());
}

// ---------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------

CreatedTrip TripManager::CreateTrip(const Caller& caller, const TripRequest& request) {
  RequireRole(caller, USER_ROLE_REQUESTER);
  if (request.payment_method == PAYMENT_METHOD_UNSPECIFIED) {
    throw util::InvalidArgument("payment method is required");
  }

  CreatedTrip created;
  created.quote = fares_->Estimate(request.service_type, request.pickup, request.dropoff);

  payment::TripDraft draft;
  draft.requester_id    = caller.user_id;
  draft.pickup          = request.pickup;
  draft.pickup_address  = request.pickup_address;
  draft.dropoff         = request.dropoff;
  draft.dropoff_address = request.dropoff_address;
  draft.service_type    = request.service_type;
  draft.vehicle_type    = request.vehicle_type;
  draft.payment_method  = request.payment_method;
  draft.estimated_fare  = created.quote.amount;
  draft.currency        = created.quote.currency;
  draft.distance_km     = created.quote.route.distance_km;
  draft.duration_min    = created.quote.route.duration_min;
  draft.scheduled_at_ms = request.scheduled_at_ms > NowMs() ? request.scheduled_at_ms : 0;
  if (request.service_type == SERVICE_TYPE_DELIVERY) {
    draft.pickup_code   = delivery::NewHandoffCode();
    draft.delivery_code = delivery::NewHandoffCode();
  }

  auto result     = holds_->CreateTripWithHold(draft);
  created.hold_id = result.hold_id;

  if (result.trip.status == TRIP_STATUS_SEARCHING) {
    try {
      dispatcher_->Start(result.trip.id);
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("first batch left to the dispatch sweep", {observability::StringField("trip_id", result.trip.id), observability::StringField("error", e.what())});
    }
  }

  auto fresh   = ReadTrip(*repository_, result.trip.id);
  created.trip = fresh ? std::move(*fresh) : std::move(result.trip);
  return created;
}

fare::Quote TripManager::EstimateFare(ServiceType service, const geo::LatLng& pickup, const geo::LatLng& dropoff) const {
  return fares_->Estimate(service, pickup, dropoff);
}

TripView TripManager::GetTrip(const Caller& caller, const std::string& trip_id, bool include_history) {
  RequireIdentity(caller);

  auto tx   = repository_->Begin();
  auto trip = repository_->GetTrip(*tx, trip_id);
  if (!trip) {
    throw util::NotFound("trip " + trip_id + " not found");
  }

  bool allowed = caller.IsAdmin() || caller.user_id == trip->requester_id || caller.user_id == trip->worker_id;
  if (!allowed && caller.role == USER_ROLE_WORKER) {
    allowed = repository_->FindOffer(*tx, trip_id, caller.user_id).has_value();
  }
  if (!allowed) {
    throw util::PermissionDenied("trip " + trip_id + " is not visible to " + caller.user_id);
  }

  TripView view;
  if (include_history) {
    view.history = repository_->ListStatusChanges(*tx, trip_id);
  }
  tx->Commit();

  view.trip = std::move(*trip);
  return view;
}

db::model::TripRecord TripManager::CancelTrip(const Caller& caller, const std::string& trip_id, const std::string& note) {
  RequireIdentity(caller);

  struct Effects {
    db::model::TripRecord               trip;
    std::vector<db::model::OfferRecord> withdrawn;
    std::string                         released_worker;
  };

  auto fx = util::RetryOnConflict(settings_.store_retry, "trip.cancel", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }

    const bool owner        = caller.role == USER_ROLE_REQUESTER && caller.user_id == trip->requester_id;
    const bool bound_worker = caller.role == USER_ROLE_WORKER && !trip->worker_id.empty() && caller.user_id == trip->worker_id;

    Effects out;
    if (bound_worker) {
      if (trip->status != TRIP_STATUS_ASSIGNED && trip->status != TRIP_STATUS_ARRIVED_PICKUP) {
        throw util::InvalidTransition("a worker can only back out of trip " + trip_id + " before pickup");
      }

      // reassignment: unbind, cancel the accepted offer, search again
      db::ThrowIfDbError(repository_->ReleaseWorker(*tx, trip_id, caller.user_id), "release worker");
      if (auto accepted = repository_->FindOffer(*tx, trip_id, caller.user_id); accepted && accepted->status == OFFER_STATUS_ACCEPTED) {
        db::ThrowIfDbError(
            repository_->ResolveOffer(*tx, accepted->id, OFFER_STATUS_ACCEPTED, OFFER_STATUS_CANCELLED, NowMs(), "worker_cancelled"),
            "cancel accepted offer");
      }

      trip = repository_->GetTrip(*tx, trip_id);
      lifecycle_->Transition(*tx, *trip, TRIP_STATUS_SEARCHING, ActorOf(caller, note));
      tx->Commit();

      out.released_worker = caller.user_id;
      out.trip            = std::move(*trip);
      return out;
    }

    if (!owner && !caller.IsAdmin()) {
      throw util::PermissionDenied("trip " + trip_id + " cannot be cancelled by " + caller.user_id);
    }

    trip->cancellation_reason = caller.IsAdmin() ? CANCELLATION_REASON_ADMIN_CANCELLED : CANCELLATION_REASON_REQUESTER_CANCELLED;
    trip->cancellation_note   = note;
    lifecycle_->Transition(*tx, *trip, TRIP_STATUS_CANCELLED, ActorOf(caller, note));

    out.withdrawn = dispatcher_->WithdrawOffers(*tx, trip_id, "trip_cancelled");
    holds_->ReleaseHold(*tx, *trip);

    uint32_t revoked = 0;
    db::ThrowIfDbError(repository_->RevokeShareTokens(*tx, trip_id, NowMs(), revoked), "revoke share tokens");
    tx->Commit();

    out.trip = std::move(*trip);
    return out;
  });

  const auto now = now_();
  if (!fx.released_worker.empty()) {
    notifier_->Publish(fx.trip.requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_STATUS_CHANGED, fx.trip, now, "worker_cancelled"));
    DISPATCH_LOG_INFO("worker backed out; trip searching again",
                      {observability::StringField("trip_id", trip_id), observability::StringField("worker_id", fx.released_worker)});
    try {
      dispatcher_->Start(trip_id);
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("re-dispatch left to the dispatch sweep", {observability::StringField("trip_id", trip_id), observability::StringField("error", e.what())});
    }
    return ReadTrip(*repository_, trip_id).value_or(fx.trip);
  }

  notifier_->Publish(fx.trip.requester_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_CANCELLED, fx.trip, now, CancellationReason_Name(fx.trip.cancellation_reason)));
  if (!fx.trip.worker_id.empty()) {
    notifier_->Publish(fx.trip.worker_id, notify::MakeTripEvent(EVENT_TYPE_TRIP_CANCELLED, fx.trip, now, CancellationReason_Name(fx.trip.cancellation_reason)));
  }
  dispatcher_->NotifyWithdrawn(fx.withdrawn, "trip_cancelled");
  observability::Metrics::Instance().RecordDispatchOutcome(observability::DispatchOutcome::kCancelled, fx.trip.service_type);

  DISPATCH_LOG_INFO("trip cancelled", {observability::StringField("trip_id", trip_id), observability::StringField("by", caller.user_id),
                                       observability::IntField("withdrawn_offers", static_cast<int64_t>(fx.withdrawn.size()))});
  return fx.trip;
}

db::model::TripRecord TripManager::UpdateStatus(const Caller& caller, const std::string& trip_id, const StatusUpdate& update) {
  RequireIdentity(caller);
  if (!IsWorkerStep(update.status)) {
    throw util::InvalidArgument("status " + TripStatus_Name(update.status) + " cannot be set directly");
  }
  if (update.final_fare < 0) {
    throw util::InvalidArgument("final fare must not be negative");
  }

  auto updated = util::RetryOnConflict(settings_.store_retry, "trip.update_status", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }
    const bool bound_worker = caller.role == USER_ROLE_WORKER && !trip->worker_id.empty() && caller.user_id == trip->worker_id;
    if (!bound_worker && !caller.IsAdmin()) {
      throw util::PermissionDenied("only the assigned worker may update trip " + trip_id);
    }

    if (bound_worker) {
      VerifyHandoff(*trip, update);
    }
    if (update.status == TRIP_STATUS_COMPLETED) {
      trip->final_fare = update.final_fare > 0 ? update.final_fare : trip->estimated_fare;
    }

    auto ctx     = ActorOf(caller, update.note);
    ctx.location = update.location;
    lifecycle_->Transition(*tx, *trip, update.status, ctx);

    if (update.status == TRIP_STATUS_COMPLETED) {
      holds_->SettleHold(*tx, *trip, trip->final_fare);
    }
    tx->Commit();
    return std::move(*trip);
  });

  const auto event = notify::MakeTripEvent(EVENT_TYPE_TRIP_STATUS_CHANGED, updated, now_());
  notifier_->Publish(updated.requester_id, event);
  if (!updated.worker_id.empty()) {
    notifier_->Publish(updated.worker_id, event);
  }
  return updated;
}

// The worker proves the parcel changed hands: pickup code to start the
// trip, delivery code to complete it. Admin overrides skip this.
void TripManager::VerifyHandoff(db::model::TripRecord& trip, const StatusUpdate& update) const {
  const bool pickup = update.status == TRIP_STATUS_IN_PROGRESS && !trip.pickup_code.empty();
  const bool drop   = update.status == TRIP_STATUS_COMPLETED && !trip.delivery_code.empty();
  if (!pickup && !drop) {
    return;
  }
  if (update.handoff_code.empty()) {
    throw util::InvalidArgument(std::string(pickup ? "pickup" : "delivery") + " code is required for trip " + trip.id);
  }

  try {
    delivery::VerifyHandoffCode(pickup ? trip.pickup_code : trip.delivery_code, update.handoff_code, pickup ? "pickup" : "delivery");
  } catch (const util::HandoffCodeMismatch&) {
    DISPATCH_LOG_WARN("handoff code rejected", {observability::StringField("trip_id", trip.id), observability::StringField("worker_id", trip.worker_id),
                                                observability::StringField("step", pickup ? "pickup" : "delivery")});
    throw;
  }

  if (pickup) {
    trip.pickup_verified_at_ms = NowMs();
  } else {
    trip.delivery_verified_at_ms = NowMs();
  }
}

db::model::TripRecord TripManager::AddTip(const Caller& caller, const std::string& trip_id, int64_t amount) {
  RequireRole(caller, USER_ROLE_REQUESTER);
  if (amount < settings_.tips.min_amount || amount > settings_.tips.max_amount) {
    throw util::InvalidArgument("tip must be between " + std::to_string(settings_.tips.min_amount) + " and " +
                                std::to_string(settings_.tips.max_amount));
  }

  auto tipped = util::RetryOnConflict(settings_.store_retry, "trip.add_tip", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }
    if (trip->requester_id != caller.user_id) {
      throw util::PermissionDenied("only the requester may tip trip " + trip_id);
    }
    if (trip->status != TRIP_STATUS_COMPLETED) {
      throw util::InvalidState("trip " + trip_id + " is not completed");
    }
    if (trip->tip_amount != 0) {
      throw util::InvalidState("trip " + trip_id + " was already tipped");
    }

    holds_->PostTip(*tx, *trip, amount);
    trip->tip_amount = amount;
    lifecycle_->Persist(*tx, *trip);
    tx->Commit();
    return std::move(*trip);
  });

  DISPATCH_LOG_INFO("tip posted", {observability::StringField("trip_id", trip_id), observability::IntField("amount", amount)});
  return tipped;
}

RatedTrip TripManager::RateTrip(const Caller& caller, const std::string& trip_id, uint32_t stars, const std::string& feedback) {
  RequireIdentity(caller);
  if (stars < 1 || stars > 5) {
    throw util::InvalidArgument("rating must be between 1 and 5 stars");
  }
  if (feedback.size() > kMaxFeedbackLength) {
    throw util::InvalidArgument("feedback must be at most " + std::to_string(kMaxFeedbackLength) + " characters");
  }

  auto rated = util::RetryOnConflict(settings_.store_retry, "trip.rate", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }

    const bool requester    = caller.role == USER_ROLE_REQUESTER && caller.user_id == trip->requester_id;
    const bool bound_worker = caller.role == USER_ROLE_WORKER && !trip->worker_id.empty() && caller.user_id == trip->worker_id;
    if (!requester && !bound_worker) {
      throw util::PermissionDenied("trip " + trip_id + " cannot be rated by " + caller.user_id);
    }
    if (trip->status != TRIP_STATUS_COMPLETED) {
      throw util::InvalidState("trip " + trip_id + " is not completed");
    }

    RatedTrip out;
    if (requester) {
      if (trip->worker_rating != 0) {
        throw util::InvalidState("trip " + trip_id + " was already rated by its requester");
      }
      trip->worker_rating   = stars;
      trip->worker_feedback = feedback;
    } else {
      if (trip->requester_rating != 0) {
        throw util::InvalidState("trip " + trip_id + " was already rated by its worker");
      }
      trip->requester_rating   = stars;
      trip->requester_feedback = feedback;
    }
    lifecycle_->Persist(*tx, *trip);

    if (requester && repository_->GetWorker(*tx, trip->worker_id)) {
      const auto summary = repository_->SummarizeWorkerRatings(*tx, trip->worker_id);
      db::ThrowIfDbError(repository_->SetWorkerRating(*tx, trip->worker_id, summary), "set worker rating");
      out.worker_rating = summary;
    }
    tx->Commit();

    out.trip = std::move(*trip);
    return out;
  });

  DISPATCH_LOG_INFO("trip rated", {observability::StringField("trip_id", trip_id), observability::StringField("by", caller.user_id),
                                   observability::IntField("stars", stars)});
  return rated;
}

db::RatingSummary TripManager::GetWorkerRating(const Caller& caller, const std::string& worker_id) {
  RequireIdentity(caller);

  auto tx     = repository_->Begin();
  auto worker = repository_->GetWorker(*tx, worker_id);
  tx->Commit();
  if (!worker) {
    throw util::NotFound("worker " + worker_id + " not found");
  }

  db::RatingSummary summary;
  summary.average = worker->rating;
  summary.count   = worker->rating_count;
  return summary;
}

// ---------------------------------------------------------------------
// Share links
// ---------------------------------------------------------------------

uint64_t TripManager::ShareExpiry(const db::model::ShareTokenRecord& token, const db::model::TripRecord& trip) const {
  uint64_t expiry = token.expires_at_ms;
  if (trip.status == TRIP_STATUS_COMPLETED && trip.completed_at_ms != 0) {
    expiry = std::min<uint64_t>(expiry, trip.completed_at_ms + static_cast<uint64_t>(settings_.sharing.post_completion_ttl.count()));
  }
  return expiry;
}

db::model::ShareTokenRecord TripManager::CreateShareLink(const Caller& caller, const std::string& trip_id) {
  RequireRole(caller, USER_ROLE_REQUESTER);

  return util::RetryOnConflict(settings_.store_retry, "trip.share", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }
    if (trip->requester_id != caller.user_id) {
      throw util::PermissionDenied("only the requester may share trip " + trip_id);
    }
    if (!IsShareable(trip->status)) {
      throw util::InvalidState("trip " + trip_id + " cannot be shared while " + TripStatus_Name(trip->status));
    }

    const auto now_ms = NowMs();
    if (auto existing = repository_->FindActiveShareToken(*tx, trip_id, now_ms); existing && ShareExpiry(*existing, *trip) > now_ms) {
      tx->Rollback();
      existing->expires_at_ms = ShareExpiry(*existing, *trip);
      return *existing;
    }

    db::model::ShareTokenRecord token;
    token.token         = util::NewId();
    token.trip_id       = trip_id;
    token.created_by    = caller.user_id;
    token.created_at_ms = now_ms;
    token.expires_at_ms = now_ms + static_cast<uint64_t>(settings_.sharing.token_ttl.count());
    token.expires_at_ms = ShareExpiry(token, *trip);
    if (token.expires_at_ms <= now_ms) {
      throw util::InvalidState("sharing window of trip " + trip_id + " has closed");
    }

    db::ThrowIfDbError(repository_->InsertShareToken(*tx, token), "insert share token");
    tx->Commit();
    return token;
  });
}

uint32_t TripManager::RevokeShareLink(const Caller& caller, const std::string& trip_id) {
  RequireRole(caller, USER_ROLE_REQUESTER);

  return util::RetryOnConflict(settings_.store_retry, "trip.revoke_share", [&] {
    auto tx   = repository_->Begin();
    auto trip = repository_->GetTrip(*tx, trip_id);
    if (!trip) {
      throw util::NotFound("trip " + trip_id + " not found");
    }
    if (trip->requester_id != caller.user_id) {
      throw util::PermissionDenied("only the requester may revoke links of trip " + trip_id);
    }

    uint32_t revoked = 0;
    db::ThrowIfDbError(repository_->RevokeShareTokens(*tx, trip_id, NowMs(), revoked), "revoke share tokens");
    tx->Commit();
    return revoked;
  });
}

SharedTrip TripManager::GetSharedTrip(const std::string& token) {
  if (token.empty()) {
    throw util::InvalidArgument("token is required");
  }

  std::optional<db::model::ShareTokenRecord> record;
  std::optional<db::model::TripRecord>       trip;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetShareToken(*tx, token);
    if (record) {
      trip = repository_->GetTrip(*tx, record->trip_id);
    }
    tx->Commit();
  }

  // one answer for every unusable token
  const auto now_ms = NowMs();
  if (!record || record->revoked_at_ms != 0 || !trip || !IsShareable(trip->status) || ShareExpiry(*record, *trip) <= now_ms) {
    throw util::NotFound("share link not found or expired");
  }

  SharedTrip shared;
  shared.expires_at_ms = ShareExpiry(*record, *trip);
  if (!trip->worker_id.empty() && trip->status != TRIP_STATUS_COMPLETED) {
    shared.worker_location = registry_->Latest(trip->worker_id);
  }
  shared.trip = std::move(*trip);
  return shared;
}

// ---------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------

OfferResponse TripManager::RespondToOffer(const Caller& caller, const std::string& trip_id, OfferDecision decision, const std::string& reason) {
  RequireRole(caller, USER_ROLE_WORKER);

  OfferResponse response;
  switch (decision) {
    case OFFER_DECISION_ACCEPT: {
      auto outcome   = arbiter_->Accept(trip_id, caller.user_id);
      response.offer = std::move(outcome.offer);
      response.trip  = std::move(outcome.trip);
      return response;
    }
    case OFFER_DECISION_DECLINE:
      response.offer = arbiter_->Decline(trip_id, caller.user_id, reason);
      try {
        dispatcher_->Reconcile(trip_id);
      } catch (const std::exception& e) {
        DISPATCH_LOG_WARN("dispatch after decline left to the sweep", {observability::StringField("trip_id", trip_id), observability::StringField("error", e.what())});
      }
      return response;
    default:
      throw util::InvalidArgument("decision must be accept or decline");
  }
}

bool TripManager::ReportLocation(const Caller& caller, db::model::WorkerLocationRecord location) {
  RequireRole(caller, USER_ROLE_WORKER);

  location.worker_id      = caller.user_id;
  location.captured_at_ms = NowMs();
  const bool persisted    = registry_->Report(location);

  std::vector<db::model::TripRecord> active;
  try {
    auto tx = repository_->Begin();
    active  = repository_->ListActiveTripsForWorker(*tx, caller.user_id);
    tx->Commit();
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("location fan-out skipped", {observability::StringField("worker_id", caller.user_id), observability::StringField("error", e.what())});
    return persisted;
  }

  const auto now = now_();
  for (const auto& trip : active) {
    notifier_->Publish(trip.requester_id, notify::MakeLocationEvent(trip.id, location, now));
  }
  return persisted;
}

std::vector<db::model::OfferRecord> TripManager::ListOffers(const Caller& caller) {
  RequireRole(caller, USER_ROLE_WORKER);

  auto tx     = repository_->Begin();
  auto offers = repository_->ListPendingOffersForWorker(*tx, caller.user_id);
  tx->Commit();

  const auto now_ms = NowMs();
  offers.erase(std::remove_if(offers.begin(), offers.end(), [&](const db::model::OfferRecord& o) { return o.expires_at_ms <= now_ms; }), offers.end());
  return offers;
}

int64_t TripManager::GetBalance(const Caller& caller) {
  RequireIdentity(caller);
  return holds_->AvailableBalance(caller.user_id);
}

} // namespace dispatch::core
