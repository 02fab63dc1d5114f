#pragma once

#include "dispatch/core/v1/types.pb.h"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/status_change_record.hpp"
#include "internal/db/model/trip_record.hpp"
#include "internal/db/model/worker_location_record.hpp"
#include "internal/geo/geo.hpp"

namespace dispatch::model {

dispatch::core::v1::Trip           ToProto(const db::model::TripRecord& record);
dispatch::core::v1::DispatchOffer  ToProto(const db::model::OfferRecord& record);
dispatch::core::v1::LedgerEntry    ToProto(const db::model::LedgerEntryRecord& record);
dispatch::core::v1::StatusChange   ToProto(const db::model::StatusChangeRecord& record);
dispatch::core::v1::WorkerLocation ToProto(const db::model::WorkerLocationRecord& record);

// Adds the delivery handoff codes. Only for the requester and admins.
void AddHandoffCodes(dispatch::core::v1::Trip* trip, const db::model::TripRecord& record);

geo::LatLng Pickup(const db::model::TripRecord& trip);
geo::LatLng Dropoff(const db::model::TripRecord& trip);
geo::LatLng FromProto(const dispatch::core::v1::GeoPoint& point);

} // namespace dispatch::model
