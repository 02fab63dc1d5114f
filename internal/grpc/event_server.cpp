#include "internal/grpc/event_server.hpp"

#include "internal/grpc/caller_identity.hpp"
#include "internal/grpc/grpc_error.hpp"

namespace dispatch::grpc {

EventServer::EventServer(std::shared_ptr<dispatch::service::EventService> svc) : service_(std::move(svc)) {
}

::grpc::Status EventServer::Subscribe(::grpc::ServerContext* context, const dispatch::services::v1::SubscribeRequest* req,
                                      ::grpc::ServerWriter<dispatch::events::v1::TripEvent>* writer) {
  try {
    service_->Subscribe(
        CallerFromContext(*context), *req, [writer](const dispatch::events::v1::TripEvent& event) { return writer->Write(event); },
        [context] { return context->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
