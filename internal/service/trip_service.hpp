#pragma once

#include "api/dispatch/v1.hpp"
#include "internal/core/caller.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::service {

class TripService {
 public:
  explicit TripService(ServiceContext ctx);

  dispatch::v1::CreateTripResponse CreateTrip(const core::Caller& caller, const dispatch::v1::CreateTripRequest& req);

  dispatch::v1::EstimateFareResponse EstimateFare(const core::Caller& caller, const dispatch::v1::EstimateFareRequest& req);

  dispatch::v1::GetTripResponse GetTrip(const core::Caller& caller, const dispatch::v1::GetTripRequest& req);

  dispatch::v1::CancelTripResponse CancelTrip(const core::Caller& caller, const dispatch::v1::CancelTripRequest& req);

  dispatch::v1::UpdateTripStatusResponse UpdateTripStatus(const core::Caller& caller, const dispatch::v1::UpdateTripStatusRequest& req);

  dispatch::v1::AddTipResponse AddTip(const core::Caller& caller, const dispatch::v1::AddTipRequest& req);

  dispatch::v1::RateTripResponse RateTrip(const core::Caller& caller, const dispatch::v1::RateTripRequest& req);

  dispatch::v1::GetWorkerRatingResponse GetWorkerRating(const core::Caller& caller, const dispatch::v1::GetWorkerRatingRequest& req);

  dispatch::v1::CreateShareLinkResponse CreateShareLink(const core::Caller& caller, const dispatch::v1::CreateShareLinkRequest& req);

  dispatch::v1::RevokeShareLinkResponse RevokeShareLink(const core::Caller& caller, const dispatch::v1::RevokeShareLinkRequest& req);

  dispatch::v1::GetBalanceResponse GetBalance(const core::Caller& caller, const dispatch::v1::GetBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
