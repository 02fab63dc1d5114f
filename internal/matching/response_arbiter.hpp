#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace dispatch::notify {
class Notifier;
}

namespace dispatch::matching {

struct AcceptOutcome {
  db::model::OfferRecord offer;
  db::model::TripRecord  trip;

  // the caller was already bound; nothing changed
  bool replayed = false;
};

/*
  Resolves worker responses.

  Accept is a compare-and-swap on the trip's bound worker: the binding,
  the offer's PENDING -> ACCEPTED move, the ASSIGNED transition and the
  cancellation of every other pending offer commit together. Exactly
  one accept per trip can win; losers get AlreadyAssigned.

  Outcomes in precedence order:
    NotFound          trip unknown
    IneligibleWorker  no offer for this worker, or worker not allowed
                      to serve the trip
    AlreadyAssigned   trip bound to another worker
    OfferExpired      trip no longer searching, offer no longer pending,
                      or offer window elapsed
*/
class ResponseArbiter {
 public:
  ResponseArbiter(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                  std::shared_ptr<notify::Notifier> notifier, util::RetryPolicy retry, util::NowFn now = util::Now);

  AcceptOutcome Accept(const std::string& trip_id, const std::string& worker_id);

  // Marks the offer declined. An offer that is no longer pending is
  // returned unchanged.
  db::model::OfferRecord Decline(const std::string& trip_id, const std::string& worker_id, const std::string& reason);

 private:
  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<lifecycle::TripLifecycle> lifecycle_;
  std::shared_ptr<notify::Notifier>         notifier_;
  util::RetryPolicy                         retry_;
  util::NowFn                               now_;
};

} // namespace dispatch::matching
