#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  Persistent trip row.

  IMPORTANT:
  - worker_id is written only through BindWorker / ReleaseWorker,
    never through UpdateTrip.
  - version guards every UpdateTrip (optimistic concurrency).
  - Timestamps are unix milliseconds; 0 = not reached.
*/

struct TripRecord {
  std::string id;
  std::string requester_id;
  std::string worker_id; // empty until bound

  dispatch::core::v1::TripStatus status = dispatch::core::v1::TRIP_STATUS_UNSPECIFIED;

  double      pickup_lat = 0;
  double      pickup_lng = 0;
  std::string pickup_address;
  double      dropoff_lat = 0;
  double      dropoff_lng = 0;
  std::string dropoff_address;

  dispatch::core::v1::ServiceType   service_type   = dispatch::core::v1::SERVICE_TYPE_UNSPECIFIED;
  dispatch::core::v1::VehicleType   vehicle_type   = dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED;
  dispatch::core::v1::PaymentMethod payment_method = dispatch::core::v1::PAYMENT_METHOD_UNSPECIFIED;

  int64_t     estimated_fare = 0;
  int64_t     final_fare     = 0;
  int64_t     tip_amount     = 0;
  std::string currency;
  std::string hold_id; // empty for cash trips

  double  distance_km  = 0;
  int32_t duration_min = 0;

  uint32_t dispatch_batch   = 0;
  uint32_t escalation_level = 0;

  dispatch::core::v1::CancellationReason cancellation_reason = dispatch::core::v1::CANCELLATION_REASON_UNSPECIFIED;
  std::string                            cancellation_note;

  // delivery trips only; see delivery/handoff_code.hpp
  std::string pickup_code;
  std::string delivery_code;

  // 1..5, 0 = unrated
  uint32_t    worker_rating = 0;
  std::string worker_feedback;
  uint32_t    requester_rating = 0;
  std::string requester_feedback;

  uint64_t scheduled_at_ms       = 0;
  uint64_t created_at_ms         = 0;
  uint64_t searching_at_ms       = 0;
  uint64_t assigned_at_ms        = 0;
  uint64_t arrived_at_ms         = 0;
  uint64_t started_at_ms         = 0;
  uint64_t arrived_dropoff_at_ms = 0;
  uint64_t completed_at_ms       = 0;
  uint64_t cancelled_at_ms       = 0;
  uint64_t pickup_verified_at_ms   = 0;
  uint64_t delivery_verified_at_ms = 0;

  uint64_t version = 0;
};

} // namespace dispatch::db::model
