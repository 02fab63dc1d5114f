#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/core/caller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fare/fare_calculator.hpp"
#include "internal/geo/geo.hpp"
#include "internal/util/time.hpp"

namespace dispatch::lifecycle {
class TripLifecycle;
}
namespace dispatch::location {
class LocationRegistry;
}
namespace dispatch::matching {
class BatchDispatcher;
class ResponseArbiter;
}
namespace dispatch::notify {
class Notifier;
}
namespace dispatch::payment {
class HoldCoordinator;
}

namespace dispatch::core {

struct TripRequest {
  geo::LatLng pickup;
  std::string pickup_address;
  geo::LatLng dropoff;
  std::string dropoff_address;

  dispatch::core::v1::ServiceType   service_type   = dispatch::core::v1::SERVICE_TYPE_UNSPECIFIED;
  dispatch::core::v1::VehicleType   vehicle_type   = dispatch::core::v1::VEHICLE_TYPE_UNSPECIFIED;
  dispatch::core::v1::PaymentMethod payment_method = dispatch::core::v1::PAYMENT_METHOD_UNSPECIFIED;

  // 0 or not in the future = dispatch now
  uint64_t scheduled_at_ms = 0;
};

struct CreatedTrip {
  db::model::TripRecord trip;
  fare::Quote           quote;
  std::string           hold_id;
};

struct TripView {
  db::model::TripRecord                       trip;
  std::vector<db::model::StatusChangeRecord> history;
};

struct StatusUpdate {
  dispatch::core::v1::TripStatus status = dispatch::core::v1::TRIP_STATUS_UNSPECIFIED;
  std::optional<geo::LatLng>     location;
  std::string                    note;
  int64_t                        final_fare = 0; // completion only; 0 keeps the estimate
  std::string                    handoff_code; // delivery pickup or drop-off code
};

struct OfferResponse {
  db::model::OfferRecord               offer;
  std::optional<db::model::TripRecord> trip; // set when the caller is bound
};

struct RatedTrip {
  db::model::TripRecord            trip;
  std::optional<db::RatingSummary> worker_rating; // set when the requester rated the worker
};

struct SharedTrip {
  db::model::TripRecord                          trip;
  std::optional<db::model::WorkerLocationRecord> worker_location;
  uint64_t                                       expires_at_ms = 0;
};

/*
  Trip operations as seen by requesters, workers and admins.

  Enforces who may do what, then delegates the state changes to the
  hold coordinator, lifecycle, dispatcher and arbiter. Notifications
  are published after the owning transaction commits and never affect
  the outcome.
*/
class TripManager {
 public:
  TripManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<fare::FareCalculator> fares,
              std::shared_ptr<payment::HoldCoordinator> holds, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
              std::shared_ptr<matching::BatchDispatcher> dispatcher, std::shared_ptr<matching::ResponseArbiter> arbiter,
              std::shared_ptr<location::LocationRegistry> registry, std::shared_ptr<notify::Notifier> notifier, config::Settings settings,
              util::NowFn now = util::Now);

  // requester
  CreatedTrip CreateTrip(const Caller& caller, const TripRequest& request);
  fare::Quote EstimateFare(dispatch::core::v1::ServiceType service, const geo::LatLng& pickup, const geo::LatLng& dropoff) const;
  db::model::TripRecord AddTip(const Caller& caller, const std::string& trip_id, int64_t amount);
  db::model::ShareTokenRecord CreateShareLink(const Caller& caller, const std::string& trip_id);
  uint32_t RevokeShareLink(const Caller& caller, const std::string& trip_id);

  // requester, bound worker or admin
  TripView GetTrip(const Caller& caller, const std::string& trip_id, bool include_history);
  db::model::TripRecord CancelTrip(const Caller& caller, const std::string& trip_id, const std::string& note);

  // bound worker or admin
  db::model::TripRecord UpdateStatus(const Caller& caller, const std::string& trip_id, const StatusUpdate& update);

  // requester rates the worker, the bound worker rates the requester
  RatedTrip RateTrip(const Caller& caller, const std::string& trip_id, uint32_t stars, const std::string& feedback);

  db::RatingSummary GetWorkerRating(const Caller& caller, const std::string& worker_id);

  // worker
  OfferResponse RespondToOffer(const Caller& caller, const std::string& trip_id, dispatch::core::v1::OfferDecision decision,
                               const std::string& reason);
  bool ReportLocation(const Caller& caller, db::model::WorkerLocationRecord location);
  std::vector<db::model::OfferRecord> ListOffers(const Caller& caller);

  int64_t GetBalance(const Caller& caller);

  // no identity; the token is the credential
  SharedTrip GetSharedTrip(const std::string& token);

 private:
  uint64_t NowMs() const;
  void     VerifyHandoff(db::model::TripRecord& trip, const StatusUpdate& update) const;
  uint64_t ShareExpiry(const db::model::ShareTokenRecord& token, const db::model::TripRecord& trip) const;

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<fare::FareCalculator>       fares_;
  std::shared_ptr<payment::HoldCoordinator>   holds_;
  std::shared_ptr<lifecycle::TripLifecycle>   lifecycle_;
  std::shared_ptr<matching::BatchDispatcher>  dispatcher_;
  std::shared_ptr<matching::ResponseArbiter>  arbiter_;
  std::shared_ptr<location::LocationRegistry> registry_;
  std::shared_ptr<notify::Notifier>           notifier_;
  config::Settings                            settings_;
  util::NowFn                                 now_;
};

} // namespace dispatch::core
