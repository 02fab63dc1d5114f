#include "internal/service/dispatch_service.hpp"

#include "internal/core/trip_manager.hpp"
#include "internal/model/conversions.hpp"
#include "internal/service/observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RespondToOfferResponse DispatchService::RespondToOffer(const core::Caller& caller, const RespondToOfferRequest& req) {
  return ObserveRpc("DispatchService.RespondToOffer", req.trip_id(), [&] {
    auto response = ctx_.manager->RespondToOffer(caller, req.trip_id(), req.decision(), req.reason());

    RespondToOfferResponse resp;
    *resp.mutable_offer() = model::ToProto(response.offer);
    if (response.trip) {
      *resp.mutable_trip() = model::ToProto(*response.trip);
    }
    return resp;
  });
}

ReportLocationResponse DispatchService::ReportLocation(const core::Caller& caller, const ReportLocationRequest& req) {
  return ObserveRpc("DispatchService.ReportLocation", {}, [&] {
    db::model::WorkerLocationRecord location;
    location.lat       = req.point().lat();
    location.lng       = req.point().lng();
    location.heading   = req.heading();
    location.speed     = req.speed();
    location.accuracy  = req.accuracy();
    location.online    = req.online();
    location.available = req.available();

    ReportLocationResponse resp;
    resp.set_persisted(ctx_.manager->ReportLocation(caller, std::move(location)));
    return resp;
  });
}

ListOffersResponse DispatchService::ListOffers(const core::Caller& caller, const ListOffersRequest&) {
  return ObserveRpc("DispatchService.ListOffers", {}, [&] {
    ListOffersResponse resp;
    for (const auto& offer : ctx_.manager->ListOffers(caller)) {
      *resp.add_offers() = model::ToProto(offer);
    }
    return resp;
  });
}

} // namespace dispatch::service
