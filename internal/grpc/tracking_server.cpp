#include "internal/grpc/tracking_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace dispatch::grpc {

TrackingServer::TrackingServer(std::shared_ptr<dispatch::service::TrackingService> svc) : service_(std::move(svc)) {
}

::grpc::Status TrackingServer::GetSharedTrip(::grpc::ServerContext*, const dispatch::services::v1::GetSharedTripRequest* req,
                                             dispatch::services::v1::GetSharedTripResponse* resp) {
  try {
    *resp = service_->GetSharedTrip(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
