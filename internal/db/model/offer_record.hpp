#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  One worker's invitation to one trip. (trip_id, worker_id) is unique:
  a worker is offered a given trip at most once.
*/
struct OfferRecord {
  std::string id;
  std::string trip_id;
  std::string worker_id;

  dispatch::core::v1::OfferStatus status = dispatch::core::v1::OFFER_STATUS_UNSPECIFIED;

  uint32_t    batch_number = 0;
  double      distance_km  = 0;
  int32_t     eta_minutes  = 0;
  std::string reason;

  uint64_t sent_at_ms      = 0;
  uint64_t responded_at_ms = 0;
  uint64_t expires_at_ms   = 0;
};

} // namespace dispatch::db::model
