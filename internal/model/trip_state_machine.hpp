#pragma once

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::model {

using dispatch::core::v1::TripStatus;

constexpr bool IsTerminal(TripStatus status) {
  return status == dispatch::core::v1::TRIP_STATUS_COMPLETED || status == dispatch::core::v1::TRIP_STATUS_CANCELLED;
}

// Statuses that count against "one active trip per requester".
constexpr bool IsActive(TripStatus status) {
  switch (status) {
    case dispatch::core::v1::TRIP_STATUS_SEARCHING:
    case dispatch::core::v1::TRIP_STATUS_ASSIGNED:
    case dispatch::core::v1::TRIP_STATUS_ARRIVED_PICKUP:
    case dispatch::core::v1::TRIP_STATUS_IN_PROGRESS:
    case dispatch::core::v1::TRIP_STATUS_ARRIVED_DROPOFF:
      return true;
    default:
      return false;
  }
}

// Closed transition table. Anything not listed is rejected.
constexpr bool CanTransition(TripStatus from, TripStatus to) {
  using namespace dispatch::core::v1;

  if (from == to || IsTerminal(from)) {
    return false;
  }
  if (to == TRIP_STATUS_CANCELLED) {
    return from != TRIP_STATUS_UNSPECIFIED;
  }

  switch (from) {
    case TRIP_STATUS_PENDING:
      return to == TRIP_STATUS_SEARCHING || to == TRIP_STATUS_SCHEDULED;
    case TRIP_STATUS_SCHEDULED:
      return to == TRIP_STATUS_SEARCHING;
    case TRIP_STATUS_SEARCHING:
      return to == TRIP_STATUS_ASSIGNED;
    case TRIP_STATUS_ASSIGNED:
      // SEARCHING: the bound worker backed out before pickup
      return to == TRIP_STATUS_ARRIVED_PICKUP || to == TRIP_STATUS_SEARCHING;
    case TRIP_STATUS_ARRIVED_PICKUP:
      return to == TRIP_STATUS_IN_PROGRESS || to == TRIP_STATUS_SEARCHING;
    case TRIP_STATUS_IN_PROGRESS:
      return to == TRIP_STATUS_ARRIVED_DROPOFF;
    case TRIP_STATUS_ARRIVED_DROPOFF:
      return to == TRIP_STATUS_COMPLETED;
    default:
      return false;
  }
}

} // namespace dispatch::model
