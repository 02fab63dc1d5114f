#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

struct StatusChangeRecord {
  std::string trip_id;

  dispatch::core::v1::TripStatus from_status = dispatch::core::v1::TRIP_STATUS_UNSPECIFIED;
  dispatch::core::v1::TripStatus to_status   = dispatch::core::v1::TRIP_STATUS_UNSPECIFIED;

  std::string                  actor_id;
  dispatch::core::v1::UserRole actor_role = dispatch::core::v1::USER_ROLE_UNSPECIFIED;

  bool   has_location = false;
  double lat          = 0;
  double lng          = 0;

  std::string note;
  uint64_t    at_ms = 0;
};

} // namespace dispatch::db::model
