#pragma once

#include "api/dispatch/v1.hpp"
#include "internal/core/caller.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::service {

class DispatchService {
 public:
  explicit DispatchService(ServiceContext ctx);

  dispatch::v1::RespondToOfferResponse RespondToOffer(const core::Caller& caller, const dispatch::v1::RespondToOfferRequest& req);

  dispatch::v1::ReportLocationResponse ReportLocation(const core::Caller& caller, const dispatch::v1::ReportLocationRequest& req);

  dispatch::v1::ListOffersResponse ListOffers(const core::Caller& caller, const dispatch::v1::ListOffersRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
