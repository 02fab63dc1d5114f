#include "internal/grpc/trip_server.hpp"

#include "internal/grpc/caller_identity.hpp"
#include "internal/grpc/grpc_error.hpp"

namespace dispatch::grpc {

using namespace dispatch::services::v1;

TripServer::TripServer(std::shared_ptr<dispatch::service::TripService> svc) : service_(std::move(svc)) {
}

::grpc::Status TripServer::CreateTrip(::grpc::ServerContext* context, const CreateTripRequest* req, CreateTripResponse* resp) {
  try {
    *resp = service_->CreateTrip(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::EstimateFare(::grpc::ServerContext* context, const EstimateFareRequest* req, EstimateFareResponse* resp) {
  try {
    *resp = service_->EstimateFare(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::GetTrip(::grpc::ServerContext* context, const GetTripRequest* req, GetTripResponse* resp) {
  try {
    *resp = service_->GetTrip(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::CancelTrip(::grpc::ServerContext* context, const CancelTripRequest* req, CancelTripResponse* resp) {
  try {
    *resp = service_->CancelTrip(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::UpdateTripStatus(::grpc::ServerContext* context, const UpdateTripStatusRequest* req, UpdateTripStatusResponse* resp) {
  try {
    *resp = service_->UpdateTripStatus(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::AddTip(::grpc::ServerContext* context, const AddTipRequest* req, AddTipResponse* resp) {
  try {
    *resp = service_->AddTip(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::RateTrip(::grpc::ServerContext* context, const RateTripRequest* req, RateTripResponse* resp) {
  try {
    *resp = service_->RateTrip(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::GetWorkerRating(::grpc::ServerContext* context, const GetWorkerRatingRequest* req, GetWorkerRatingResponse* resp) {
  try {
    *resp = service_->GetWorkerRating(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::CreateShareLink(::grpc::ServerContext* context, const CreateShareLinkRequest* req, CreateShareLinkResponse* resp) {
  try {
    *resp = service_->CreateShareLink(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::RevokeShareLink(::grpc::ServerContext* context, const RevokeShareLinkRequest* req, RevokeShareLinkResponse* resp) {
  try {
    *resp = service_->RevokeShareLink(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TripServer::GetBalance(::grpc::ServerContext* context, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(CallerFromContext(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
