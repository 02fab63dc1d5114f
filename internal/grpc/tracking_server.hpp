#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/tracking_service.grpc.pb.h"
#include "internal/service/tracking_service.hpp"

namespace dispatch::grpc {

class TrackingServer final : public dispatch::services::v1::TrackingService::Service {
 public:
  explicit TrackingServer(std::shared_ptr<dispatch::service::TrackingService> svc);

  ::grpc::Status GetSharedTrip(::grpc::ServerContext*, const dispatch::services::v1::GetSharedTripRequest* req,
                               dispatch::services::v1::GetSharedTripResponse* resp) override;

 private:
  std::shared_ptr<dispatch::service::TrackingService> service_;
};

} // namespace dispatch::grpc
