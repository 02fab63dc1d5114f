#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "config/config.pb.h"
#include "internal/util/retry.hpp"

namespace dispatch::config {

using Millis = std::chrono::milliseconds;

struct DispatchSettings {
  Millis   offer_window{20000};
  uint32_t batch_size                    = 5;
  double   initial_radius_km             = 5.0;
  double   radius_multiplier             = 1.5;
  double   max_radius_km                 = 15.0;
  uint32_t max_escalations               = 3;
  uint32_t max_batches                   = 8;
  uint32_t max_pending_offers_per_worker = 1;
  uint32_t pending_cap_relax_step        = 1;
  Millis   sweep_interval{2000};
};

struct LocationSettings {
  Millis liveness_window{5 * 60 * 1000};
  Millis retention{24 * 60 * 60 * 1000};
  Millis prune_interval{10 * 60 * 1000};
};

// Minor currency units.
struct FareSchedule {
  int64_t     base_fare    = 0;
  int64_t     per_km       = 0;
  int64_t     per_minute   = 0;
  int64_t     minimum_fare = 0;
  std::string currency;
};

struct SharingSettings {
  Millis token_ttl{24 * 60 * 60 * 1000};
  Millis post_completion_ttl{2 * 60 * 60 * 1000};
};

struct TipSettings {
  int64_t min_amount = 50;
  int64_t max_amount = 50000;
};

/*
  Resolved runtime settings: RuntimeConfig with every unset field
  replaced by its default. Built once at startup, then read-only.
*/
struct Settings {
  DispatchSettings                                      dispatch;
  LocationSettings                                      location;
  std::map<dispatch::core::v1::ServiceType, FareSchedule> fares;
  double                                                average_speed_kmh = 30.0;
  util::RetryPolicy                                     store_retry;
  Millis                                                schedule_poll_interval{60000};
  SharingSettings                                       sharing;
  TipSettings                                           tips;

  const FareSchedule& FareFor(dispatch::core::v1::ServiceType service) const;
};

// Built-in fare schedules for STANDARD, PREMIUM and DELIVERY.
std::map<dispatch::core::v1::ServiceType, FareSchedule> DefaultFares();

// Throws std::runtime_error("Invalid configuration: ...") on bad values.
Settings LoadSettings(const dispatch::runtime::config::RuntimeConfig& config);

} // namespace dispatch::config
