#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace dispatch::notify {
class Notifier;
}

namespace dispatch::payment {
class HoldCoordinator;
}

namespace dispatch::matching {
class BatchDispatcher;
}

namespace dispatch::schedule {

struct TriggerSummary {
  uint32_t due       = 0;
  uint32_t promoted  = 0;
  uint32_t cancelled = 0;
  uint32_t failed    = 0;
};

/*
  Promotes scheduled trips whose time has come.

  The only transition made here is SCHEDULED -> SEARCHING, after which
  the trip is handed to the dispatcher. When the requester already has
  an active trip the scheduled one is cancelled (SCHEDULE_CONFLICT) and
  its hold refunded instead. Each trip is its own unit of work; one
  failure does not stop the run.
*/
class ScheduledTrigger {
 public:
  ScheduledTrigger(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::TripLifecycle> lifecycle,
                   std::shared_ptr<payment::HoldCoordinator> holds, std::shared_ptr<matching::BatchDispatcher> dispatcher,
                   std::shared_ptr<notify::Notifier> notifier, util::RetryPolicy retry, util::NowFn now = util::Now);

  TriggerSummary RunOnce();

 private:
  enum class Outcome { kPromoted, kCancelled, kSkipped };

  Outcome Promote(const std::string& trip_id);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<lifecycle::TripLifecycle>   lifecycle_;
  std::shared_ptr<payment::HoldCoordinator>   holds_;
  std::shared_ptr<matching::BatchDispatcher>  dispatcher_;
  std::shared_ptr<notify::Notifier>           notifier_;
  util::RetryPolicy                           retry_;
  util::NowFn                                 now_;
};

} // namespace dispatch::schedule
