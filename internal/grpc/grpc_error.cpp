#include "internal/grpc/grpc_error.hpp"

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::grpc {

namespace {

struct Mapping {
  ::grpc::StatusCode            status;
  dispatch::core::v1::ErrorCode code;
};

Mapping Classify(const std::exception& e) {
  using namespace dispatch::util;
  using namespace dispatch::core::v1;

  if (dynamic_cast<const InsufficientFunds*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, ERROR_CODE_INSUFFICIENT_FUNDS};
  }
  if (dynamic_cast<const ActiveTripConflict*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, ERROR_CODE_ACTIVE_TRIP_CONFLICT};
  }
  if (dynamic_cast<const NoMatchFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, ERROR_CODE_NO_MATCH_FOUND};
  }
  if (dynamic_cast<const OfferExpired*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, ERROR_CODE_OFFER_EXPIRED};
  }
  if (dynamic_cast<const AlreadyAssigned*>(&e)) {
    return {::grpc::StatusCode::ABORTED, ERROR_CODE_ALREADY_ASSIGNED};
  }
  if (dynamic_cast<const IneligibleWorker*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, ERROR_CODE_INELIGIBLE_WORKER};
  }
  if (dynamic_cast<const HandoffCodeMismatch*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, ERROR_CODE_HANDOFF_CODE_MISMATCH};
  }
  if (dynamic_cast<const InvalidTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, ERROR_CODE_INVALID_TRANSITION};
  }
  // an unretried TransactionConflict is reported like an exhausted retry
  if (dynamic_cast<const StoreConflict*>(&e) || dynamic_cast<const dispatch::db::TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, ERROR_CODE_STORE_CONFLICT};
  }
  if (dynamic_cast<const UpstreamUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, ERROR_CODE_UPSTREAM_UNAVAILABLE};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, ERROR_CODE_NOT_FOUND};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, ERROR_CODE_INVALID_ARGUMENT};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, ERROR_CODE_INVALID_STATE};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, ERROR_CODE_PERMISSION_DENIED};
  }
  if (dynamic_cast<const Unauthenticated*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, ERROR_CODE_UNAUTHENTICATED};
  }

  return {::grpc::StatusCode::INTERNAL, ERROR_CODE_UNSPECIFIED};
}

} // namespace

dispatch::core::v1::ErrorCode ToErrorCode(const std::exception& e) {
  return Classify(e).code;
}

::grpc::Status ToStatus(const std::exception& e) {
  const auto mapping = Classify(e);
  if (mapping.code == dispatch::core::v1::ERROR_CODE_UNSPECIFIED) {
    return {mapping.status, e.what()};
  }
  return {mapping.status, e.what(), dispatch::core::v1::ErrorCode_Name(mapping.code)};
}

} // namespace dispatch::grpc
