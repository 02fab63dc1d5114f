#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/trip_service.grpc.pb.h"
#include "internal/service/trip_service.hpp"

namespace dispatch::grpc {

class TripServer final : public dispatch::services::v1::TripService::Service {
 public:
  explicit TripServer(std::shared_ptr<dispatch::service::TripService> svc);

  ::grpc::Status CreateTrip(::grpc::ServerContext* context, const dispatch::services::v1::CreateTripRequest* req,
                      dispatch::services::v1::CreateTripResponse* resp) override;

  ::grpc::Status EstimateFare(::grpc::ServerContext* context, const dispatch::services::v1::EstimateFareRequest* req,
                      dispatch::services::v1::EstimateFareResponse* resp) override;

  ::grpc::Status GetTrip(::grpc::ServerContext* context, const dispatch::services::v1::GetTripRequest* req,
                      dispatch::services::v1::GetTripResponse* resp) override;

  ::grpc::Status CancelTrip(::grpc::ServerContext* context, const dispatch::services::v1::CancelTripRequest* req,
                      dispatch::services::v1::CancelTripResponse* resp) override;

  ::grpc::Status UpdateTripStatus(::grpc::ServerContext* context, const dispatch::services::v1::UpdateTripStatusRequest* req,
                      dispatch::services::v1::UpdateTripStatusResponse* resp) override;

  ::grpc::Status AddTip(::grpc::ServerContext* context, const dispatch::services::v1::AddTipRequest* req,
                      dispatch::services::v1::AddTipResponse* resp) override;

  ::grpc::Status RateTrip(::grpc::ServerContext* context, const dispatch::services::v1::RateTripRequest* req,
                        dispatch::services::v1::RateTripResponse* resp) override;

  ::grpc::Status GetWorkerRating(::grpc::ServerContext* context, const dispatch::services::v1::GetWorkerRatingRequest* req,
                                 dispatch::services::v1::GetWorkerRatingResponse* resp) override;

  ::grpc::Status CreateShareLink(::grpc::ServerContext* context, const dispatch::services::v1::CreateShareLinkRequest* req,
                      dispatch::services::v1::CreateShareLinkResponse* resp) override;

  ::grpc::Status RevokeShareLink(::grpc::ServerContext* context, const dispatch::services::v1::RevokeShareLinkRequest* req,
                      dispatch::services::v1::RevokeShareLinkResponse* resp) override;

  ::grpc::Status GetBalance(::grpc::ServerContext* context, const dispatch::services::v1::GetBalanceRequest* req,
                      dispatch::services::v1::GetBalanceResponse* resp) override;

 private:
  std::shared_ptr<dispatch::service::TripService> service_;
};

} // namespace dispatch::grpc
