#pragma once

#include <chrono>
#include <functional>

#include "api/dispatch/v1.hpp"
#include "internal/core/caller.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::service {

/*
  Live event stream for one connection.

  Subscribe registers a sink with the notifier, forwards events to
  `write` until the client goes away, the writer fails, or the
  notifier shuts down, then unregisters.
*/
class EventService {
 public:
  using WriteFn     = std::function<bool(const dispatch::v1::TripEvent&)>;
  using CancelledFn = std::function<bool()>;

  explicit EventService(ServiceContext ctx, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250));

  // Returns the number of events written.
  uint64_t Subscribe(const core::Caller& caller, const dispatch::v1::SubscribeRequest& req, const WriteFn& write, const CancelledFn& cancelled);

 private:
  ServiceContext            ctx_;
  std::chrono::milliseconds poll_interval_;
};

} // namespace dispatch::service
