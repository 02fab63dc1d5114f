#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/geo/geo.hpp"
#include "internal/util/time.hpp"

namespace dispatch::lifecycle {

struct TransitionContext {
  std::string                  actor_id;
  dispatch::core::v1::UserRole actor_role = dispatch::core::v1::USER_ROLE_UNSPECIFIED;
  std::optional<geo::LatLng>   location;
  std::string                  note;
};

// Actor recorded for transitions the service makes on its own.
TransitionContext SystemActor(std::string note = {});

/*
  The only writer of trip status.

  Transition validates the edge against the closed table, stamps the
  milestone, writes the row guarded by its version and appends the
  history entry, all inside the caller's transaction. On return the
  record carries the new status and version.

  Errors:
    InvalidTransition    edge not in the table
    ActiveTripConflict   entering an active status while the requester
                         already has another active trip
    db::TransactionConflict  the row changed since it was read
*/
class TripLifecycle {
 public:
  explicit TripLifecycle(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  void Transition(db::Transaction& tx, db::model::TripRecord& trip, dispatch::core::v1::TripStatus to, const TransitionContext& ctx);

  // Writes non-status changes (fares, counters) with the same version guard.
  void Persist(db::Transaction& tx, db::model::TripRecord& trip);

  util::TimePoint Now() const {
    return now_();
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace dispatch::lifecycle
