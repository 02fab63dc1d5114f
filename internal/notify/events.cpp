#include "internal/notify/events.hpp"

#include "internal/model/conversions.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::notify {

namespace {

dispatch::events::v1::TripEvent Header(dispatch::events::v1::EventType type, const std::string& trip_id, util::TimePoint at,
                                       const std::string& reason) {
  dispatch::events::v1::TripEvent event;
  event.set_event_id(util::NewId());
  event.set_type(type);
  event.set_trip_id(trip_id);
  event.set_reason(reason);
  *event.mutable_at() = util::ToProto(at);
  return event;
}

} // namespace

dispatch::events::v1::TripEvent MakeTripEvent(dispatch::events::v1::EventType type, const db::model::TripRecord& trip, util::TimePoint at,
                                          const std::string& reason) {
  auto event            = Header(type, trip.id, at, reason);
  *event.mutable_trip() = model::ToProto(trip);
  return event;
}

dispatch::events::v1::TripEvent MakeOfferEvent(dispatch::events::v1::EventType type, const db::model::OfferRecord& offer, util::TimePoint at,
                                           const std::string& reason) {
  auto event             = Header(type, offer.trip_id, at, reason);
  *event.mutable_offer() = model::ToProto(offer);
  return event;
}

dispatch::events::v1::TripEvent MakeLocationEvent(const std::string& trip_id, const db::model::WorkerLocationRecord& location, util::TimePoint at) {
  auto event                = Header(dispatch::events::v1::EVENT_TYPE_WORKER_LOCATION, trip_id, at, {});
  *event.mutable_location() = model::ToProto(location);
  return event;
}

} // namespace dispatch::notify
