#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace dispatch::db::sql {

namespace {

struct Types {
  const char* integer;   // 64-bit
  const char* real;
  const char* small;
  const char* serial_pk; // auto-increment primary key
};

Types TypesFor(Dialect dialect) {
  if (dialect == Dialect::kPostgres) {
    return {"BIGINT", "DOUBLE PRECISION", "INTEGER", "BIGSERIAL PRIMARY KEY"};
  }
  return {"INTEGER", "REAL", "INTEGER", "INTEGER PRIMARY KEY AUTOINCREMENT"};
}

} // namespace

std::vector<std::string> SchemaStatements(Dialect dialect) {
  const auto        t = TypesFor(dialect);
  const std::string I = t.integer;
  const std::string R = t.real;
  const std::string S = t.small;
  const std::string Z = " NOT NULL DEFAULT 0";

  std::vector<std::string> out;

  out.push_back("CREATE TABLE IF NOT EXISTS trips ("
                "id TEXT PRIMARY KEY, requester_id TEXT NOT NULL, worker_id TEXT, status " + S + " NOT NULL,"
                " pickup_lat " + R + " NOT NULL, pickup_lng " + R + " NOT NULL, pickup_address TEXT NOT NULL DEFAULT '',"
                " dropoff_lat " + R + " NOT NULL, dropoff_lng " + R + " NOT NULL, dropoff_address TEXT NOT NULL DEFAULT '',"
                " service_type " + S + " NOT NULL, vehicle_type " + S + Z + ", payment_method " + S + " NOT NULL,"
                " estimated_fare " + I + Z + ", final_fare " + I + Z + ", tip_amount " + I + Z + ","
                " currency TEXT NOT NULL DEFAULT '', hold_id TEXT NOT NULL DEFAULT '',"
                " distance_km " + R + Z + ", duration_min " + S + Z + ","
                " dispatch_batch " + S + Z + ", escalation_level " + S + Z + ","
                " cancellation_reason " + S + Z + ", cancellation_note TEXT NOT NULL DEFAULT '',"
                " scheduled_at_ms " + I + Z + ", created_at_ms " + I + Z + ", searching_at_ms " + I + Z + ","
                " assigned_at_ms " + I + Z + ", arrived_at_ms " + I + Z + ", started_at_ms " + I + Z + ","
                " arrived_dropoff_at_ms " + I + Z + ", completed_at_ms " + I + Z + ", cancelled_at_ms " + I + Z + ","
                " pickup_code TEXT NOT NULL DEFAULT '', delivery_code TEXT NOT NULL DEFAULT '',"
                " worker_rating " + S + Z + ", worker_feedback TEXT NOT NULL DEFAULT '',"
                " requester_rating " + S + Z + ", requester_feedback TEXT NOT NULL DEFAULT '',"
                " pickup_verified_at_ms " + I + Z + ", delivery_verified_at_ms " + I + Z + ","
                " version " + I + " NOT NULL);");

  // status 3..7 = searching, assigned, arrived_pickup, in_progress, arrived_dropoff
  out.push_back("CREATE UNIQUE INDEX IF NOT EXISTS trips_one_active_per_requester ON trips(requester_id)"
                " WHERE status IN (3,4,5,6,7);");
  out.push_back("CREATE INDEX IF NOT EXISTS trips_status ON trips(status, scheduled_at_ms);");
  out.push_back("CREATE INDEX IF NOT EXISTS trips_worker ON trips(worker_id);");

  out.push_back("CREATE TABLE IF NOT EXISTS trip_status_changes ("
                "seq " + std::string(t.serial_pk) + ", trip_id TEXT NOT NULL REFERENCES trips(id),"
                " from_status " + S + " NOT NULL, to_status " + S + " NOT NULL,"
                " actor_id TEXT NOT NULL DEFAULT '', actor_role " + S + Z + ","
                " has_location " + S + Z + ", lat " + R + Z + ", lng " + R + Z + ","
                " note TEXT NOT NULL DEFAULT '', at_ms " + I + " NOT NULL);");
  out.push_back("CREATE INDEX IF NOT EXISTS trip_status_changes_trip ON trip_status_changes(trip_id);");

  out.push_back("CREATE TABLE IF NOT EXISTS dispatch_offers ("
                "id TEXT PRIMARY KEY, trip_id TEXT NOT NULL REFERENCES trips(id), worker_id TEXT NOT NULL,"
                " status " + S + " NOT NULL, batch_number " + S + " NOT NULL,"
                " distance_km " + R + Z + ", eta_minutes " + S + Z + ", reason TEXT NOT NULL DEFAULT '',"
                " sent_at_ms " + I + " NOT NULL, responded_at_ms " + I + Z + ", expires_at_ms " + I + " NOT NULL,"
                " UNIQUE(trip_id, worker_id));");
  out.push_back("CREATE INDEX IF NOT EXISTS dispatch_offers_worker_status ON dispatch_offers(worker_id, status);");
  out.push_back("CREATE INDEX IF NOT EXISTS dispatch_offers_status_expiry ON dispatch_offers(status, expires_at_ms);");

  // settles_entry_id is NULL unless the row converts a hold
  out.push_back("CREATE TABLE IF NOT EXISTS ledger_entries ("
                "seq " + std::string(t.serial_pk) + ", id TEXT NOT NULL UNIQUE, account_id TEXT NOT NULL, trip_id TEXT,"
                " type " + S + " NOT NULL, amount " + I + " NOT NULL, currency TEXT NOT NULL DEFAULT '',"
                " status " + S + " NOT NULL, reference TEXT NOT NULL DEFAULT '', settles_entry_id TEXT UNIQUE,"
                " created_at_ms " + I + " NOT NULL);");
  out.push_back("CREATE INDEX IF NOT EXISTS ledger_entries_account ON ledger_entries(account_id);");
  out.push_back("CREATE INDEX IF NOT EXISTS ledger_entries_trip ON ledger_entries(trip_id);");

  out.push_back("CREATE TABLE IF NOT EXISTS workers ("
                "id TEXT PRIMARY KEY, service_mask " + I + Z + ", vehicle_type " + S + Z + ","
                " eligible " + S + Z + ", max_active_trips " + S + " NOT NULL DEFAULT 1, rating " + R + Z + ","
                " rating_count " + S + Z + ","
                " updated_at_ms " + I + Z + ");");

  out.push_back("CREATE TABLE IF NOT EXISTS worker_locations ("
                "seq " + std::string(t.serial_pk) + ", worker_id TEXT NOT NULL,"
                " lat " + R + " NOT NULL, lng " + R + " NOT NULL, heading " + R + Z + ", speed " + R + Z + ","
                " accuracy " + R + Z + ", online " + S + Z + ", available " + S + Z + ","
                " captured_at_ms " + I + " NOT NULL);");
  out.push_back("CREATE INDEX IF NOT EXISTS worker_locations_latest ON worker_locations(worker_id, captured_at_ms);");

  out.push_back("CREATE TABLE IF NOT EXISTS share_tokens ("
                "token TEXT PRIMARY KEY, trip_id TEXT NOT NULL REFERENCES trips(id), created_by TEXT NOT NULL,"
                " created_at_ms " + I + " NOT NULL, expires_at_ms " + I + " NOT NULL, revoked_at_ms " + I + Z + ");");
  out.push_back("CREATE INDEX IF NOT EXISTS share_tokens_trip ON share_tokens(trip_id);");

  return out;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    try {
      executor.ExecuteSQL(sql);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration failed: " + std::string(e.what()) + " [" + sql.substr(0, 80) + "]");
    }
  }
}

std::string NumberPlaceholders(std::string_view sql) {
  std::string out;
  out.reserve(sql.size() + 16);

  int  index     = 0;
  bool in_quotes = false;
  for (char c : sql) {
    if (c == '\'') {
      in_quotes = !in_quotes;
    }
    if (c == '?' && !in_quotes) {
      out += '$';
      out += std::to_string(++index);
      continue;
    }
    out += c;
  }
  return out;
}

} // namespace dispatch::db::sql
