#include "internal/lifecycle/trip_lifecycle.hpp"

#include "internal/db/api/result_check.hpp"
#include "internal/model/trip_state_machine.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::lifecycle {

using namespace dispatch::core::v1;

namespace {

void Stamp(db::model::TripRecord& trip, TripStatus to, uint64_t now_ms) {
  switch (to) {
    case TRIP_STATUS_SEARCHING:
      trip.searching_at_ms = now_ms;
      break;
    case TRIP_STATUS_ASSIGNED:
      trip.assigned_at_ms = now_ms;
      break;
    case TRIP_STATUS_ARRIVED_PICKUP:
      trip.arrived_at_ms = now_ms;
      break;
    case TRIP_STATUS_IN_PROGRESS:
      trip.started_at_ms = now_ms;
      break;
    case TRIP_STATUS_ARRIVED_DROPOFF:
      trip.arrived_dropoff_at_ms = now_ms;
      break;
    case TRIP_STATUS_COMPLETED:
      trip.completed_at_ms = now_ms;
      break;
    case TRIP_STATUS_CANCELLED:
      trip.cancelled_at_ms = now_ms;
      break;
    default:
      break;
  }
}

} // namespace

TransitionContext SystemActor(std::string note) {
  TransitionContext ctx;
  ctx.actor_id = "system";
  ctx.note     = std::move(note);
  return ctx;
}

TripLifecycle::TripLifecycle(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

void TripLifecycle::Transition(db::Transaction& tx, db::model::TripRecord& trip, TripStatus to, const TransitionContext& ctx) {
  const auto from = trip.status;
  if (!model::CanTransition(from, to)) {
    throw util::InvalidTransition("trip " + trip.id + ": " + TripStatus_Name(from) + " -> " + TripStatus_Name(to) + " is not allowed");
  }

  const auto now_ms = util::ToUnixMillis(now_());

  auto next   = trip;
  next.status = to;
  Stamp(next, to, now_ms);
  Persist(tx, next);

  db::model::StatusChangeRecord change;
  change.trip_id     = trip.id;
  change.from_status = from;
  change.to_status   = to;
  change.actor_id    = ctx.actor_id;
  change.actor_role  = ctx.actor_role;
  if (ctx.location) {
    change.has_location = true;
    change.lat          = ctx.location->lat;
    change.lng          = ctx.location->lng;
  }
  change.note  = ctx.note;
  change.at_ms = now_ms;
  db::ThrowIfDbError(repository_->AppendStatusChange(tx, change), "append status change");

  trip = std::move(next);
}

void TripLifecycle::Persist(db::Transaction& tx, db::model::TripRecord& trip) {
  const auto result = repository_->UpdateTrip(tx, trip, trip.version);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw util::ActiveTripConflict("requester " + trip.requester_id + " already has an active trip");
  }
  db::ThrowIfDbError(result, "update trip " + trip.id);
  ++trip.version;
}

} // namespace dispatch::lifecycle
