#include "internal/service/trip_service.hpp"

#include "internal/core/trip_manager.hpp"
#include "internal/model/conversions.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/time.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

namespace {

FareEstimate ToProto(const fare::Quote& quote) {
  FareEstimate fare;
  fare.set_amount(quote.amount);
  fare.set_currency(quote.currency);
  fare.set_distance_km(quote.route.distance_km);
  fare.set_duration_min(quote.route.duration_min);
  fare.set_routed_fallback(quote.route.fallback);
  return fare;
}

} // namespace

TripService::TripService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateTripResponse TripService::CreateTrip(const core::Caller& caller, const CreateTripRequest& req) {
  return ObserveRpc("TripService.CreateTrip", {}, [&] {
    core::TripRequest request;
    request.pickup          = model::FromProto(req.pickup().point());
    request.pickup_address  = req.pickup().address();
    request.dropoff         = model::FromProto(req.dropoff().point());
    request.dropoff_address = req.dropoff().address();
    request.service_type    = req.service_type();
    request.vehicle_type    = req.vehicle_type();
    request.payment_method  = req.payment_method();
    if (req.has_scheduled_at()) {
      request.scheduled_at_ms = util::ToUnixMillis(util::FromProto(req.scheduled_at()));
    }

    auto created = ctx_.manager->CreateTrip(caller, request);

    CreateTripResponse resp;
    *resp.mutable_trip() = model::ToProto(created.trip);
    model::AddHandoffCodes(resp.mutable_trip(), created.trip);
    *resp.mutable_fare() = ToProto(created.quote);
    resp.set_hold_id(created.hold_id);
    return resp;
  });
}

EstimateFareResponse TripService::EstimateFare(const core::Caller& caller, const EstimateFareRequest& req) {
  return ObserveRpc("TripService.EstimateFare", {}, [&] {
    core::RequireIdentity(caller);

    EstimateFareResponse resp;
    *resp.mutable_fare() =
        ToProto(ctx_.manager->EstimateFare(req.service_type(), model::FromProto(req.pickup().point()), model::FromProto(req.dropoff().point())));
    return resp;
  });
}

GetTripResponse TripService::GetTrip(const core::Caller& caller, const GetTripRequest& req) {
  return ObserveRpc("TripService.GetTrip", req.trip_id(), [&] {
    auto view = ctx_.manager->GetTrip(caller, req.trip_id(), req.include_history());

    GetTripResponse resp;
    *resp.mutable_trip() = model::ToProto(view.trip);
    if (caller.IsAdmin() || caller.user_id == view.trip.requester_id) {
      model::AddHandoffCodes(resp.mutable_trip(), view.trip);
    }
    for (const auto& change : view.history) {
      *resp.add_history() = model::ToProto(change);
    }
    return resp;
  });
}

CancelTripResponse TripService::CancelTrip(const core::Caller& caller, const CancelTripRequest& req) {
  return ObserveRpc("TripService.CancelTrip", req.trip_id(), [&] {
    CancelTripResponse resp;
    *resp.mutable_trip() = model::ToProto(ctx_.manager->CancelTrip(caller, req.trip_id(), req.note()));
    return resp;
  });
}

UpdateTripStatusResponse TripService::UpdateTripStatus(const core::Caller& caller, const UpdateTripStatusRequest& req) {
  return ObserveRpc("TripService.UpdateTripStatus", req.trip_id(), [&] {
    core::StatusUpdate update;
    update.status = req.status();
    if (req.has_location()) {
      update.location = model::FromProto(req.location());
    }
    update.note       = req.note();
    update.final_fare   = req.final_fare();
    update.handoff_code = req.handoff_code();

    UpdateTripStatusResponse resp;
    *resp.mutable_trip() = model::ToProto(ctx_.manager->UpdateStatus(caller, req.trip_id(), update));
    return resp;
  });
}

AddTipResponse TripService::AddTip(const core::Caller& caller, const AddTipRequest& req) {
  return ObserveRpc("TripService.AddTip", req.trip_id(), [&] {
    AddTipResponse resp;
    *resp.mutable_trip() = model::ToProto(ctx_.manager->AddTip(caller, req.trip_id(), req.amount()));
    return resp;
  });
}

RateTripResponse TripService::RateTrip(const core::Caller& caller, const RateTripRequest& req) {
  return ObserveRpc("TripService.RateTrip", req.trip_id(), [&] {
    auto rated = ctx_.manager->RateTrip(caller, req.trip_id(), req.stars(), req.feedback());

    RateTripResponse resp;
    *resp.mutable_trip() = model::ToProto(rated.trip);
    if (rated.worker_rating) {
      auto* rating = resp.mutable_worker_rating();
      rating->set_worker_id(rated.trip.worker_id);
      rating->set_average(rated.worker_rating->average);
      rating->set_count(rated.worker_rating->count);
    }
    return resp;
  });
}

GetWorkerRatingResponse TripService::GetWorkerRating(const core::Caller& caller, const GetWorkerRatingRequest& req) {
  return ObserveRpc("TripService.GetWorkerRating", {}, [&] {
    const auto summary = ctx_.manager->GetWorkerRating(caller, req.worker_id());

    GetWorkerRatingResponse resp;
    resp.mutable_rating()->set_worker_id(req.worker_id());
    resp.mutable_rating()->set_average(summary.average);
    resp.mutable_rating()->set_count(summary.count);
    return resp;
  });
}

CreateShareLinkResponse TripService::CreateShareLink(const core::Caller& caller, const CreateShareLinkRequest& req) {
  return ObserveRpc("TripService.CreateShareLink", req.trip_id(), [&] {
    auto token = ctx_.manager->CreateShareLink(caller, req.trip_id());

    CreateShareLinkResponse resp;
    resp.set_token(token.token);
    *resp.mutable_expires_at() = util::MillisToProto(token.expires_at_ms);
    return resp;
  });
}

RevokeShareLinkResponse TripService::RevokeShareLink(const core::Caller& caller, const RevokeShareLinkRequest& req) {
  return ObserveRpc("TripService.RevokeShareLink", req.trip_id(), [&] {
    RevokeShareLinkResponse resp;
    resp.set_revoked(ctx_.manager->RevokeShareLink(caller, req.trip_id()));
    return resp;
  });
}

GetBalanceResponse TripService::GetBalance(const core::Caller& caller, const GetBalanceRequest&) {
  return ObserveRpc("TripService.GetBalance", {}, [&] {
    GetBalanceResponse resp;
    resp.set_available(ctx_.manager->GetBalance(caller));
    resp.set_account_id(caller.user_id);
    return resp;
  });
}

} // namespace dispatch::service
