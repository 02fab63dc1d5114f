#include "internal/config/settings.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace dispatch::config {

namespace v1 = dispatch::core::v1;

namespace {

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

Millis DurationOr(bool present, const google::protobuf::Duration& d, Millis fallback, const char* name) {
  if (!present) {
    return fallback;
  }
  const auto ms = Millis(d.seconds() * 1000 + d.nanos() / 1000000);
  if (ms.count() <= 0) {
    Invalid(std::string(name) + " must be positive");
  }
  return ms;
}

template <typename T>
T Or(T value, T fallback) {
  return value == T{} ? fallback : value;
}

} // namespace

std::map<v1::ServiceType, FareSchedule> DefaultFares() {
  return {
      {v1::SERVICE_TYPE_STANDARD, {250, 120, 25, 500, "USD"}},
      {v1::SERVICE_TYPE_PREMIUM, {500, 200, 40, 1000, "USD"}},
      {v1::SERVICE_TYPE_DELIVERY, {200, 80, 15, 400, "USD"}},
  };
}

const FareSchedule& Settings::FareFor(v1::ServiceType service) const {
  auto it = fares.find(service);
  if (it == fares.end()) {
    throw util::InvalidArgument("no fare schedule for service type " + v1::ServiceType_Name(service));
  }
  return it->second;
}

Settings LoadSettings(const dispatch::runtime::config::RuntimeConfig& config) {
  Settings settings;

  // ------------------------------------------------------------------
  // Dispatch
  // ------------------------------------------------------------------
  const auto& d  = config.dispatch();
  auto&       ds = settings.dispatch;

  ds.offer_window                  = DurationOr(d.has_offer_window(), d.offer_window(), ds.offer_window, "dispatch.offer_window");
  ds.batch_size                    = Or(d.batch_size(), ds.batch_size);
  ds.initial_radius_km             = Or(d.initial_radius_km(), ds.initial_radius_km);
  ds.radius_multiplier             = Or(d.radius_multiplier(), ds.radius_multiplier);
  ds.max_radius_km                 = Or(d.max_radius_km(), ds.max_radius_km);
  ds.max_escalations               = Or(d.max_escalations(), ds.max_escalations);
  ds.max_batches                   = Or(d.max_batches(), ds.max_batches);
  ds.max_pending_offers_per_worker = Or(d.max_pending_offers_per_worker(), ds.max_pending_offers_per_worker);
  ds.pending_cap_relax_step        = Or(d.pending_cap_relax_step(), ds.pending_cap_relax_step);
  ds.sweep_interval                = DurationOr(d.has_sweep_interval(), d.sweep_interval(), ds.sweep_interval, "dispatch.sweep_interval");

  if (ds.initial_radius_km <= 0 || ds.max_radius_km <= 0) {
    Invalid("dispatch radii must be positive");
  }
  if (ds.initial_radius_km > ds.max_radius_km) {
    Invalid("dispatch.initial_radius_km exceeds dispatch.max_radius_km");
  }
  if (ds.radius_multiplier < 1.0) {
    Invalid("dispatch.radius_multiplier must be >= 1");
  }

  // ------------------------------------------------------------------
  // Location
  // ------------------------------------------------------------------
  const auto& l  = config.location();
  auto&       ls = settings.location;

  ls.liveness_window = DurationOr(l.has_liveness_window(), l.liveness_window(), ls.liveness_window, "location.liveness_window");
  ls.retention       = DurationOr(l.has_retention(), l.retention(), ls.retention, "location.retention");
  ls.prune_interval  = DurationOr(l.has_prune_interval(), l.prune_interval(), ls.prune_interval, "location.prune_interval");

  if (ls.retention < ls.liveness_window) {
    Invalid("location.retention must cover location.liveness_window");
  }

  // ------------------------------------------------------------------
  // Fares
  // ------------------------------------------------------------------
  settings.fares = DefaultFares();
  for (const auto& fare : config.fares()) {
    if (fare.service_type() == v1::SERVICE_TYPE_UNSPECIFIED) {
      Invalid("fares[].service_type is required");
    }
    if (fare.base_fare() < 0 || fare.per_km() < 0 || fare.per_minute() < 0 || fare.minimum_fare() < 0) {
      Invalid("fare amounts must not be negative");
    }
    settings.fares[fare.service_type()] = {fare.base_fare(), fare.per_km(), fare.per_minute(), fare.minimum_fare(),
                                           fare.currency().empty() ? "USD" : fare.currency()};
  }

  settings.average_speed_kmh = Or(config.routing().average_speed_kmh(), settings.average_speed_kmh);
  if (settings.average_speed_kmh <= 0) {
    Invalid("routing.average_speed_kmh must be positive");
  }

  // ------------------------------------------------------------------
  // Store retry, scheduling, sharing, tips
  // ------------------------------------------------------------------
  const auto& r = config.store_retry();
  settings.store_retry.max_attempts = Or(r.max_attempts(), settings.store_retry.max_attempts);
  settings.store_retry.initial_backoff =
      DurationOr(r.has_initial_backoff(), r.initial_backoff(), settings.store_retry.initial_backoff, "store_retry.initial_backoff");
  settings.store_retry.max_backoff =
      DurationOr(r.has_max_backoff(), r.max_backoff(), settings.store_retry.max_backoff, "store_retry.max_backoff");
  if (settings.store_retry.max_backoff < settings.store_retry.initial_backoff) {
    Invalid("store_retry.max_backoff is below store_retry.initial_backoff");
  }

  settings.schedule_poll_interval = DurationOr(config.scheduling().has_poll_interval(), config.scheduling().poll_interval(),
                                               settings.schedule_poll_interval, "scheduling.poll_interval");

  const auto& s = config.sharing();
  settings.sharing.token_ttl = DurationOr(s.has_token_ttl(), s.token_ttl(), settings.sharing.token_ttl, "sharing.token_ttl");
  settings.sharing.post_completion_ttl =
      DurationOr(s.has_post_completion_ttl(), s.post_completion_ttl(), settings.sharing.post_completion_ttl, "sharing.post_completion_ttl");

  settings.tips.min_amount = Or(config.tips().min_amount(), settings.tips.min_amount);
  settings.tips.max_amount = Or(config.tips().max_amount(), settings.tips.max_amount);
  if (settings.tips.min_amount <= 0 || settings.tips.min_amount > settings.tips.max_amount) {
    Invalid("tips range is empty");
  }

  const auto ratio = config.observability().trace_sample_ratio();
  if (ratio < 0 || ratio > 1) {
    Invalid("observability.trace_sample_ratio must be within [0, 1]");
  }

  return settings;
}

} // namespace dispatch::config
