#include "internal/service/event_service.hpp"

#include <memory>

#include "internal/notify/notifier.hpp"
#include "internal/notify/queue_event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

namespace {

class RegistrationGuard {
 public:
  RegistrationGuard(notify::Notifier& notifier, std::string connection_id) : notifier_(notifier), connection_id_(std::move(connection_id)) {
  }

  ~RegistrationGuard() {
    notifier_.Unregister(connection_id_);
  }

  RegistrationGuard(const RegistrationGuard&)            = delete;
  RegistrationGuard& operator=(const RegistrationGuard&) = delete;

 private:
  notify::Notifier& notifier_;
  std::string       connection_id_;
};

} // namespace

EventService::EventService(ServiceContext ctx, std::chrono::milliseconds poll_interval) : ctx_(std::move(ctx)), poll_interval_(poll_interval) {
}

uint64_t EventService::Subscribe(const core::Caller& caller, const SubscribeRequest& req, const WriteFn& write, const CancelledFn& cancelled) {
  core::RequireIdentity(caller);

  const auto connection_id = req.connection_id().empty() ? util::NewId() : req.connection_id();

  observability::SpanScope span("EventService.Subscribe");
  span.SetAttribute("connection.id", connection_id);
  span.SetAttribute("user.id", caller.user_id);

  auto sink = std::make_shared<notify::QueueEventSink>();
  ctx_.notifier->Register(connection_id, caller.user_id, caller.role, sink);
  RegistrationGuard guard(*ctx_.notifier, connection_id);

  DISPATCH_LOG_INFO("Event stream opened", {observability::StringField("connection_id", connection_id),
                                            observability::StringField("user_id", caller.user_id)});

  uint64_t written = 0;
  while (!cancelled()) {
    auto event = sink->Next(poll_interval_);
    if (!event) {
      if (sink->IsClosed()) {
        break;
      }
      continue;
    }
    if (!write(*event)) {
      DISPATCH_LOG_WARN("Event stream write failed", {observability::StringField("connection_id", connection_id)});
      break;
    }
    ++written;
  }

  span.SetAttribute("events.written", static_cast<std::int64_t>(written));
  DISPATCH_LOG_INFO("Event stream closed", {observability::StringField("connection_id", connection_id),
                                            observability::IntField("events_written", static_cast<std::int64_t>(written))});
  return written;
}

} // namespace dispatch::service
