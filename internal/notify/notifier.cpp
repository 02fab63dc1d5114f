#include "internal/notify/notifier.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::notify {

Notifier::Notifier(util::NowFn now) : now_(std::move(now)) {
}

Notifier::~Notifier() {
  Shutdown();
}

void Notifier::Register(const std::string& connection_id, const std::string& user_id, dispatch::core::v1::UserRole role,
                        std::shared_ptr<EventSink> sink) {
  if (connection_id.empty() || user_id.empty() || !sink) {
    throw util::InvalidArgument("connection id, user id and sink are required");
  }

  std::size_t live = 0;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("notifier is shut down");
    }
    if (connections_.count(connection_id) != 0) {
      throw util::InvalidArgument("connection already registered: " + connection_id);
    }

    const auto now_ms = util::ToUnixMillis(now_());

    Entry entry;
    entry.info.connection_id    = connection_id;
    entry.info.user_id          = user_id;
    entry.info.role             = role;
    entry.info.connected        = true;
    entry.info.connected_at_ms  = now_ms;
    entry.info.last_activity_ms = now_ms;
    entry.sink                  = std::move(sink);

    connections_.emplace(connection_id, std::move(entry));
    by_user_[user_id].insert(connection_id);
    live = connections_.size();
  }

  observability::Metrics::Instance().SetLiveConnections(static_cast<int64_t>(live));
  DISPATCH_LOG_DEBUG("connection registered", {observability::StringField("connection_id", connection_id), observability::StringField("user_id", user_id)});
}

std::optional<LiveConnection> Notifier::Unregister(const std::string& connection_id) {
  std::shared_ptr<EventSink> sink;
  LiveConnection             info;
  std::size_t                live = 0;
  {
    std::lock_guard lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return std::nullopt;
    }

    sink                    = std::move(it->second.sink);
    info                    = it->second.info;
    info.connected          = false;
    info.disconnected_at_ms = util::ToUnixMillis(now_());

    auto user = by_user_.find(it->second.info.user_id);
    if (user != by_user_.end()) {
      user->second.erase(connection_id);
      if (user->second.empty()) {
        by_user_.erase(user);
      }
    }
    connections_.erase(it);
    live = connections_.size();
  }

  sink->Close();
  observability::Metrics::Instance().SetLiveConnections(static_cast<int64_t>(live));
  return info;
}

std::size_t Notifier::Publish(const std::string& user_id, const dispatch::events::v1::TripEvent& event) {
  std::vector<std::pair<std::string, std::shared_ptr<EventSink>>> targets;
  {
    std::lock_guard lock(mutex_);
    auto user = by_user_.find(user_id);
    if (user == by_user_.end()) {
      return 0;
    }

    const auto now_ms = util::ToUnixMillis(now_());
    for (const auto& id : user->second) {
      auto& entry                  = connections_.at(id);
      entry.info.last_activity_ms = now_ms;
      targets.emplace_back(id, entry.sink);
    }
  }

  // sinks are called without the registry lock
  std::size_t delivered = 0;
  for (const auto& [connection_id, sink] : targets) {
    bool ok = false;
    try {
      ok = sink->Deliver(event);
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("event delivery failed", {observability::StringField("connection_id", connection_id), observability::StringField("error", e.what())});
    }

    observability::Metrics::Instance().RecordNotification(ok);
    if (ok) {
      ++delivered;
    } else {
      DISPATCH_LOG_WARN("event dropped", {observability::StringField("connection_id", connection_id), observability::StringField("user_id", user_id),
                                          observability::StringField("event", dispatch::events::v1::EventType_Name(event.type()))});
    }
  }
  return delivered;
}

void Notifier::Shutdown() {
  std::vector<std::shared_ptr<EventSink>> sinks;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;

    for (auto& [id, entry] : connections_) {
      sinks.push_back(std::move(entry.sink));
    }
    connections_.clear();
    by_user_.clear();
  }

  for (auto& sink : sinks) {
    sink->Close();
  }
  observability::Metrics::Instance().SetLiveConnections(0);
}

std::size_t Notifier::ConnectionCount() const {
  std::lock_guard lock(mutex_);
  return connections_.size();
}

std::size_t Notifier::ConnectionCount(const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_user_.find(user_id);
  return it == by_user_.end() ? 0 : it->second.size();
}

std::optional<LiveConnection> Notifier::Connection(const std::string& connection_id) const {
  std::lock_guard lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

} // namespace dispatch::notify
