#pragma once

#include <string>

#include "dispatch/events/v1/events.pb.h"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/trip_record.hpp"
#include "internal/db/model/worker_location_record.hpp"
#include "internal/util/time.hpp"

namespace dispatch::notify {

// Event constructors. Every event gets a fresh event_id.

dispatch::events::v1::TripEvent MakeTripEvent(dispatch::events::v1::EventType type, const db::model::TripRecord& trip, util::TimePoint at,
                                          const std::string& reason = {});

dispatch::events::v1::TripEvent MakeOfferEvent(dispatch::events::v1::EventType type, const db::model::OfferRecord& offer, util::TimePoint at,
                                           const std::string& reason = {});

dispatch::events::v1::TripEvent MakeLocationEvent(const std::string& trip_id, const db::model::WorkerLocationRecord& location, util::TimePoint at);

} // namespace dispatch::notify
