#include "internal/grpc/admin_server.hpp"

#include "internal/grpc/caller_identity.hpp"
#include "internal/grpc/grpc_error.hpp"

namespace dispatch::grpc {

AdminServer::AdminServer(std::shared_ptr<dispatch::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::UpsertWorker(::grpc::ServerContext* context, const dispatch::services::v1::UpsertWorkerRequest* req,
                                         dispatch::services::v1::UpsertWorkerResponse* resp) {
  try {
    *resp = service_->UpsertWorker(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::PostCredit(::grpc::ServerContext* context, const dispatch::services::v1::PostCreditRequest* req,
                                       dispatch::services::v1::PostCreditResponse* resp) {
  try {
    *resp = service_->PostCredit(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
