#include "internal/model/conversions.hpp"

#include "internal/util/time.hpp"

namespace dispatch::model {

namespace {

void SetPlace(dispatch::core::v1::Place* place, double lat, double lng, const std::string& address) {
  place->mutable_point()->set_lat(lat);
  place->mutable_point()->set_lng(lng);
  place->set_address(address);
}

void SetTime(google::protobuf::Timestamp* out, uint64_t ms) {
  if (ms != 0) {
    *out = util::MillisToProto(ms);
  }
}

} // namespace

dispatch::core::v1::Trip ToProto(const db::model::TripRecord& record) {
  dispatch::core::v1::Trip trip;
  trip.set_id(record.id);
  trip.set_requester_id(record.requester_id);
  trip.set_worker_id(record.worker_id);
  trip.set_status(record.status);
  SetPlace(trip.mutable_pickup(), record.pickup_lat, record.pickup_lng, record.pickup_address);
  SetPlace(trip.mutable_dropoff(), record.dropoff_lat, record.dropoff_lng, record.dropoff_address);
  trip.set_service_type(record.service_type);
  trip.set_vehicle_type(record.vehicle_type);
  trip.set_payment_method(record.payment_method);
  trip.set_estimated_fare(record.estimated_fare);
  trip.set_final_fare(record.final_fare);
  trip.set_currency(record.currency);
  trip.set_hold_id(record.hold_id);
  trip.set_distance_km(record.distance_km);
  trip.set_duration_min(record.duration_min);
  trip.set_tip_amount(record.tip_amount);
  trip.set_dispatch_batch(record.dispatch_batch);
  trip.set_escalation_level(record.escalation_level);
  trip.set_cancellation_reason(record.cancellation_reason);
  trip.set_cancellation_note(record.cancellation_note);
  trip.set_worker_rating(record.worker_rating);
  trip.set_worker_feedback(record.worker_feedback);
  trip.set_requester_rating(record.requester_rating);
  trip.set_requester_feedback(record.requester_feedback);

  SetTime(trip.mutable_scheduled_at(), record.scheduled_at_ms);
  SetTime(trip.mutable_created_at(), record.created_at_ms);
  SetTime(trip.mutable_searching_at(), record.searching_at_ms);
  SetTime(trip.mutable_assigned_at(), record.assigned_at_ms);
  SetTime(trip.mutable_arrived_at(), record.arrived_at_ms);
  SetTime(trip.mutable_started_at(), record.started_at_ms);
  SetTime(trip.mutable_arrived_dropoff_at(), record.arrived_dropoff_at_ms);
  SetTime(trip.mutable_completed_at(), record.completed_at_ms);
  SetTime(trip.mutable_cancelled_at(), record.cancelled_at_ms);
  SetTime(trip.mutable_pickup_verified_at(), record.pickup_verified_at_ms);
  SetTime(trip.mutable_delivery_verified_at(), record.delivery_verified_at_ms);
  return trip;
}

void AddHandoffCodes(dispatch::core::v1::Trip* trip, const db::model::TripRecord& record) {
  trip->set_pickup_code(record.pickup_code);
  trip->set_delivery_code(record.delivery_code);
}

dispatch::core::v1::DispatchOffer ToProto(const db::model::OfferRecord& record) {
  dispatch::core::v1::DispatchOffer offer;
  offer.set_id(record.id);
  offer.set_trip_id(record.trip_id);
  offer.set_worker_id(record.worker_id);
  offer.set_status(record.status);
  offer.set_batch_number(record.batch_number);
  offer.set_distance_km(record.distance_km);
  offer.set_eta_minutes(record.eta_minutes);
  offer.set_reason(record.reason);
  SetTime(offer.mutable_sent_at(), record.sent_at_ms);
  SetTime(offer.mutable_responded_at(), record.responded_at_ms);
  SetTime(offer.mutable_expires_at(), record.expires_at_ms);
  return offer;
}

dispatch::core::v1::LedgerEntry ToProto(const db::model::LedgerEntryRecord& record) {
  dispatch::core::v1::LedgerEntry entry;
  entry.set_id(record.id);
  entry.set_account_id(record.account_id);
  entry.set_trip_id(record.trip_id);
  entry.set_type(record.type);
  entry.set_amount(record.amount);
  entry.set_currency(record.currency);
  entry.set_status(record.status);
  entry.set_reference(record.reference);
  entry.set_settles_entry_id(record.settles_entry_id);
  SetTime(entry.mutable_created_at(), record.created_at_ms);
  return entry;
}

dispatch::core::v1::StatusChange ToProto(const db::model::StatusChangeRecord& record) {
  dispatch::core::v1::StatusChange change;
  change.set_trip_id(record.trip_id);
  change.set_from_status(record.from_status);
  change.set_to_status(record.to_status);
  change.set_actor_id(record.actor_id);
  change.set_actor_role(record.actor_role);
  if (record.has_location) {
    change.mutable_location()->set_lat(record.lat);
    change.mutable_location()->set_lng(record.lng);
  }
  change.set_note(record.note);
  SetTime(change.mutable_at(), record.at_ms);
  return change;
}

dispatch::core::v1::WorkerLocation ToProto(const db::model::WorkerLocationRecord& record) {
  dispatch::core::v1::WorkerLocation location;
  location.set_worker_id(record.worker_id);
  location.mutable_point()->set_lat(record.lat);
  location.mutable_point()->set_lng(record.lng);
  location.set_heading(record.heading);
  location.set_speed(record.speed);
  location.set_accuracy(record.accuracy);
  location.set_online(record.online);
  location.set_available(record.available);
  SetTime(location.mutable_captured_at(), record.captured_at_ms);
  return location;
}

geo::LatLng Pickup(const db::model::TripRecord& trip) {
  return {trip.pickup_lat, trip.pickup_lng};
}

geo::LatLng Dropoff(const db::model::TripRecord& trip) {
  return {trip.dropoff_lat, trip.dropoff_lng};
}

geo::LatLng FromProto(const dispatch::core::v1::GeoPoint& point) {
  return {point.lat(), point.lng()};
}

} // namespace dispatch::model
