#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/dispatch_service.grpc.pb.h"
#include "internal/service/dispatch_service.hpp"

namespace dispatch::grpc {

class DispatchServer final : public dispatch::services::v1::DispatchService::Service {
 public:
  explicit DispatchServer(std::shared_ptr<dispatch::service::DispatchService> svc);

  ::grpc::Status RespondToOffer(::grpc::ServerContext* context, const dispatch::services::v1::RespondToOfferRequest* req,
                                dispatch::services::v1::RespondToOfferResponse* resp) override;

  ::grpc::Status ReportLocation(::grpc::ServerContext* context, const dispatch::services::v1::ReportLocationRequest* req,
                                dispatch::services::v1::ReportLocationResponse* resp) override;

  ::grpc::Status ListOffers(::grpc::ServerContext* context, const dispatch::services::v1::ListOffersRequest* req,
                            dispatch::services::v1::ListOffersResponse* resp) override;

 private:
  std::shared_ptr<dispatch::service::DispatchService> service_;
};

} // namespace dispatch::grpc
