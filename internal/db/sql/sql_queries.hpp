#pragma once

#include <string>
#include <string_view>

namespace dispatch::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in the SQLite/Postgres common subset with `?`
  placeholders. Enum columns hold the protobuf enum numbers.
*/

#define DISPATCH_TRIP_COLUMNS                                                                                                       \
  "id,requester_id,worker_id,status,pickup_lat,pickup_lng,pickup_address,dropoff_lat,dropoff_lng,dropoff_address,"             \
  "service_type,vehicle_type,payment_method,estimated_fare,final_fare,tip_amount,currency,hold_id,distance_km,duration_min," \
  "dispatch_batch,escalation_level,cancellation_reason,cancellation_note,scheduled_at_ms,created_at_ms,searching_at_ms,"     \
  "assigned_at_ms,arrived_at_ms,started_at_ms,arrived_dropoff_at_ms,completed_at_ms,cancelled_at_ms,"                        \
  "pickup_code,delivery_code,worker_rating,worker_feedback,requester_rating,requester_feedback,"                               \
  "pickup_verified_at_ms,delivery_verified_at_ms,version"

#define DISPATCH_OFFER_COLUMNS \
  "id,trip_id,worker_id,status,batch_number,distance_km,eta_minutes,reason,sent_at_ms,responded_at_ms,expires_at_ms"

#define DISPATCH_LEDGER_COLUMNS "id,account_id,trip_id,type,amount,currency,status,reference,settles_entry_id,created_at_ms"

#define DISPATCH_WORKER_COLUMNS "id,service_mask,vehicle_type,eligible,max_active_trips,rating,rating_count,updated_at_ms"

#define DISPATCH_LOCATION_COLUMNS "worker_id,lat,lng,heading,speed,accuracy,online,available,captured_at_ms"

#define DISPATCH_SHARE_TOKEN_COLUMNS "token,trip_id,created_by,created_at_ms,expires_at_ms,revoked_at_ms"

// trips

static constexpr const char* INSERT_TRIP =
    "INSERT INTO trips(" DISPATCH_TRIP_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TRIP = "SELECT " DISPATCH_TRIP_COLUMNS " FROM trips WHERE id=?;";

// worker_id is deliberately absent: bound through BIND_WORKER only.
static constexpr const char* UPDATE_TRIP =
    "UPDATE trips SET status=?,pickup_lat=?,pickup_lng=?,pickup_address=?,dropoff_lat=?,dropoff_lng=?,dropoff_address=?,"
    "service_type=?,vehicle_type=?,payment_method=?,estimated_fare=?,final_fare=?,tip_amount=?,currency=?,hold_id=?,"
    "distance_km=?,duration_min=?,dispatch_batch=?,escalation_level=?,cancellation_reason=?,cancellation_note=?,"
    "scheduled_at_ms=?,created_at_ms=?,searching_at_ms=?,assigned_at_ms=?,arrived_at_ms=?,started_at_ms=?,"
    "arrived_dropoff_at_ms=?,completed_at_ms=?,cancelled_at_ms=?,pickup_code=?,delivery_code=?,worker_rating=?,"
    "worker_feedback=?,requester_rating=?,requester_feedback=?,pickup_verified_at_ms=?,delivery_verified_at_ms=?,"
    "version=version+1"
    " WHERE id=? AND version=?;";

static constexpr const char* BIND_WORKER =
    "UPDATE trips SET worker_id=?,version=version+1"
    " WHERE id=? AND worker_id IS NULL AND status=?;";

static constexpr const char* RELEASE_WORKER =
    "UPDATE trips SET worker_id=NULL,version=version+1"
    " WHERE id=? AND worker_id=?;";

static constexpr const char* SELECT_ACTIVE_TRIPS_FOR_REQUESTER =
    "SELECT " DISPATCH_TRIP_COLUMNS " FROM trips WHERE requester_id=? AND status IN (?,?,?,?,?)"
    " ORDER BY created_at_ms, id;";

static constexpr const char* SELECT_ACTIVE_TRIPS_FOR_WORKER =
    "SELECT " DISPATCH_TRIP_COLUMNS " FROM trips WHERE worker_id=? AND status IN (?,?,?,?,?)"
    " ORDER BY created_at_ms, id;";

static constexpr const char* SELECT_TRIPS_BY_STATUS =
    "SELECT " DISPATCH_TRIP_COLUMNS " FROM trips WHERE status=? ORDER BY created_at_ms, id;";

static constexpr const char* SELECT_DUE_SCHEDULED_TRIPS =
    "SELECT " DISPATCH_TRIP_COLUMNS " FROM trips WHERE status=? AND scheduled_at_ms<=?"
    " ORDER BY scheduled_at_ms, created_at_ms, id;";

// status history

static constexpr const char* INSERT_STATUS_CHANGE =
    "INSERT INTO trip_status_changes(trip_id,from_status,to_status,actor_id,actor_role,has_location,lat,lng,note,at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_STATUS_CHANGES =
    "SELECT trip_id,from_status,to_status,actor_id,actor_role,has_location,lat,lng,note,at_ms"
    " FROM trip_status_changes WHERE trip_id=? ORDER BY seq;";

// offers

static constexpr const char* INSERT_OFFER =
    "INSERT INTO dispatch_offers(" DISPATCH_OFFER_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_OFFER = "SELECT " DISPATCH_OFFER_COLUMNS " FROM dispatch_offers WHERE id=?;";

static constexpr const char* SELECT_OFFER_BY_TRIP_WORKER =
    "SELECT " DISPATCH_OFFER_COLUMNS " FROM dispatch_offers WHERE trip_id=? AND worker_id=?;";

static constexpr const char* SELECT_OFFERS_FOR_TRIP =
    "SELECT " DISPATCH_OFFER_COLUMNS " FROM dispatch_offers WHERE trip_id=? ORDER BY batch_number, id;";

static constexpr const char* SELECT_PENDING_OFFERS_FOR_WORKER =
    "SELECT " DISPATCH_OFFER_COLUMNS " FROM dispatch_offers WHERE worker_id=? AND status=? ORDER BY id;";

static constexpr const char* COUNT_PENDING_OFFERS_FOR_WORKER =
    "SELECT COUNT(*) FROM dispatch_offers WHERE worker_id=? AND status=? AND trip_id<>?;";

static constexpr const char* SELECT_EXPIRED_PENDING_OFFERS =
    "SELECT " DISPATCH_OFFER_COLUMNS " FROM dispatch_offers WHERE status=? AND expires_at_ms<=? ORDER BY id;";

static constexpr const char* RESOLVE_OFFER =
    "UPDATE dispatch_offers SET status=?,responded_at_ms=?,reason=? WHERE id=? AND status=?;";

// ledger

static constexpr const char* INSERT_LEDGER_ENTRY =
    "INSERT INTO ledger_entries(" DISPATCH_LEDGER_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LEDGER_ENTRY = "SELECT " DISPATCH_LEDGER_COLUMNS " FROM ledger_entries WHERE id=?;";

static constexpr const char* SELECT_LEDGER_ENTRIES_FOR_ACCOUNT =
    "SELECT " DISPATCH_LEDGER_COLUMNS " FROM ledger_entries WHERE account_id=? ORDER BY seq;";

static constexpr const char* SELECT_LEDGER_ENTRIES_FOR_TRIP =
    "SELECT " DISPATCH_LEDGER_COLUMNS " FROM ledger_entries WHERE trip_id=? ORDER BY seq;";

static constexpr const char* SELECT_SETTLEMENT =
    "SELECT " DISPATCH_LEDGER_COLUMNS " FROM ledger_entries WHERE settles_entry_id=?;";

// params: credit, refund, debit, hold, debit, completed, account, completed
static constexpr const char* SELECT_AVAILABLE_BALANCE =
    "SELECT COALESCE(SUM(CASE"
    " WHEN e.type IN (?,?) THEN e.amount"
    " WHEN e.type=? THEN -e.amount"
    " WHEN e.type=? AND NOT EXISTS (SELECT 1 FROM ledger_entries d"
    "   WHERE d.settles_entry_id=e.id AND d.type=? AND d.status=?) THEN -e.amount"
    " ELSE 0 END),0)"
    " FROM ledger_entries e WHERE e.account_id=? AND e.status=?;";

// workers

// rating and rating_count keep their stored values on conflict
static constexpr const char* UPSERT_WORKER =
    "INSERT INTO workers(" DISPATCH_WORKER_COLUMNS ") VALUES(?,?,?,?,?,0,0,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " service_mask=excluded.service_mask,"
    " vehicle_type=excluded.vehicle_type,"
    " eligible=excluded.eligible,"
    " max_active_trips=excluded.max_active_trips,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SUMMARIZE_WORKER_RATINGS =
    "SELECT COALESCE(AVG(CAST(worker_rating AS DOUBLE PRECISION)),0),COUNT(*) FROM trips"
    " WHERE worker_id=? AND worker_rating>0;";

static constexpr const char* SET_WORKER_RATING = "UPDATE workers SET rating=?,rating_count=? WHERE id=?;";

static constexpr const char* SELECT_WORKER = "SELECT " DISPATCH_WORKER_COLUMNS " FROM workers WHERE id=?;";

static constexpr const char* SELECT_WORKERS = "SELECT " DISPATCH_WORKER_COLUMNS " FROM workers ORDER BY id;";

// worker locations

static constexpr const char* INSERT_WORKER_LOCATION =
    "INSERT INTO worker_locations(" DISPATCH_LOCATION_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LATEST_WORKER_LOCATIONS =
    "SELECT " DISPATCH_LOCATION_COLUMNS " FROM worker_locations l"
    " WHERE l.captured_at_ms>=? AND l.seq=(SELECT m.seq FROM worker_locations m WHERE m.worker_id=l.worker_id"
    "   ORDER BY m.captured_at_ms DESC, m.seq DESC LIMIT 1)"
    " ORDER BY l.worker_id;";

static constexpr const char* SELECT_LATEST_WORKER_LOCATION =
    "SELECT " DISPATCH_LOCATION_COLUMNS " FROM worker_locations WHERE worker_id=?"
    " ORDER BY captured_at_ms DESC, seq DESC LIMIT 1;";

static constexpr const char* PRUNE_WORKER_LOCATIONS =
    "DELETE FROM worker_locations WHERE captured_at_ms<?"
    " AND seq<>(SELECT m.seq FROM worker_locations m WHERE m.worker_id=worker_locations.worker_id"
    "   ORDER BY m.captured_at_ms DESC, m.seq DESC LIMIT 1);";

// share tokens

static constexpr const char* INSERT_SHARE_TOKEN =
    "INSERT INTO share_tokens(" DISPATCH_SHARE_TOKEN_COLUMNS ") VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_SHARE_TOKEN = "SELECT " DISPATCH_SHARE_TOKEN_COLUMNS " FROM share_tokens WHERE token=?;";

static constexpr const char* SELECT_ACTIVE_SHARE_TOKEN =
    "SELECT " DISPATCH_SHARE_TOKEN_COLUMNS " FROM share_tokens"
    " WHERE trip_id=? AND revoked_at_ms=0 AND expires_at_ms>? ORDER BY created_at_ms DESC LIMIT 1;";

static constexpr const char* REVOKE_SHARE_TOKENS =
    "UPDATE share_tokens SET revoked_at_ms=? WHERE trip_id=? AND revoked_at_ms=0;";

// Rewrites `?` placeholders as `$1..$n` (quoted literals are left alone).
std::string NumberPlaceholders(std::string_view sql);

} // namespace dispatch::db::sql
