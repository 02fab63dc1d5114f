#pragma once

#include "api/dispatch/v1.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::service {

/*
  Read-only trip view for holders of a share token. The token is the
  only credential.
*/
class TrackingService {
 public:
  explicit TrackingService(ServiceContext ctx);

  dispatch::v1::GetSharedTripResponse GetSharedTrip(const dispatch::v1::GetSharedTripRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
