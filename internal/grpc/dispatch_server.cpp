#include "internal/grpc/dispatch_server.hpp"

#include "internal/grpc/caller_identity.hpp"
#include "internal/grpc/grpc_error.hpp"

namespace dispatch::grpc {

using namespace dispatch::services::v1;

DispatchServer::DispatchServer(std::shared_ptr<dispatch::service::DispatchService> svc) : service_(std::move(svc)) {
}

::grpc::Status DispatchServer::RespondToOffer(::grpc::ServerContext* context, const RespondToOfferRequest* req, RespondToOfferResponse* resp) {
  try {
    *resp = service_->RespondToOffer(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::ReportLocation(::grpc::ServerContext* context, const ReportLocationRequest* req, ReportLocationResponse* resp) {
  try {
    *resp = service_->ReportLocation(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::ListOffers(::grpc::ServerContext* context, const ListOffersRequest* req, ListOffersResponse* resp) {
  try {
    *resp = service_->ListOffers(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
