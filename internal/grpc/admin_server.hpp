#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace dispatch::grpc {

class AdminServer final : public dispatch::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<dispatch::service::AdminService> svc);

  ::grpc::Status UpsertWorker(::grpc::ServerContext* context, const dispatch::services::v1::UpsertWorkerRequest* req,
                              dispatch::services::v1::UpsertWorkerResponse* resp) override;

  ::grpc::Status PostCredit(::grpc::ServerContext* context, const dispatch::services::v1::PostCreditRequest* req,
                            dispatch::services::v1::PostCreditResponse* resp) override;

 private:
  std::shared_ptr<dispatch::service::AdminService> service_;
};

} // namespace dispatch::grpc
