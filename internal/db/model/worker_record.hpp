#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

// Eligibility and capability flags owned by the registration workflow.
struct WorkerRecord {
  std::string id;

  // bit (1 << ServiceType) per service the worker may serve
  uint32_t service_mask = 0;

  dispatch::core::v1::VehicleType vehicle_type = dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED;

  bool     eligible         = false;
  uint32_t max_active_trips = 1;

  // Mean of requester ratings. Owned by RateTrip, kept by UpsertWorker.
  double   rating       = 0;
  uint32_t rating_count = 0;

  uint64_t updated_at_ms = 0;

  bool Serves(dispatch::core::v1::ServiceType service) const {
    return (service_mask & (1u << static_cast<uint32_t>(service))) != 0;
  }
};

} // namespace dispatch::db::model
