#include "internal/service/tracking_service.hpp"

#include "internal/core/trip_manager.hpp"
#include "internal/model/conversions.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

TrackingService::TrackingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetSharedTripResponse TrackingService::GetSharedTrip(const GetSharedTripRequest& req) {
  return ObserveRpc("TrackingService.GetSharedTrip", {}, [&] {
    if (req.token().empty()) {
      throw util::InvalidArgument("token is required");
    }

    auto shared = ctx_.manager->GetSharedTrip(req.token());
    auto trip   = model::ToProto(shared.trip);

    GetSharedTripResponse resp;
    auto* view = resp.mutable_view();
    view->set_status(trip.status());
    view->set_service_type(trip.service_type());
    *view->mutable_pickup()  = trip.pickup();
    *view->mutable_dropoff() = trip.dropoff();
    view->set_has_worker(!shared.trip.worker_id.empty());
    if (shared.worker_location) {
      *view->mutable_worker_location() = model::ToProto(*shared.worker_location);
      // requester and worker identities stay private
      view->mutable_worker_location()->clear_worker_id();
    }

    if (trip.has_assigned_at()) *view->mutable_assigned_at() = trip.assigned_at();
    if (trip.has_arrived_at()) *view->mutable_arrived_at() = trip.arrived_at();
    if (trip.has_started_at()) *view->mutable_started_at() = trip.started_at();
    if (trip.has_completed_at()) *view->mutable_completed_at() = trip.completed_at();
    *view->mutable_expires_at() = util::MillisToProto(shared.expires_at_ms);
    return resp;
  });
}

} // namespace dispatch::service
