#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "dispatch/core/v1/types.pb.h"
#include "dispatch/events/v1/events.pb.h"
#include "internal/notify/event_sink.hpp"
#include "internal/util/time.hpp"

namespace dispatch::notify {

struct LiveConnection {
  std::string                  connection_id;
  std::string                  user_id;
  dispatch::core::v1::UserRole role = dispatch::core::v1::USER_ROLE_UNSPECIFIED;

  bool     connected          = false;
  uint64_t connected_at_ms    = 0;
  uint64_t last_activity_ms   = 0;
  uint64_t disconnected_at_ms = 0;
};

/*
  Live connection registry and fan-out.

  - A user may hold several connections; Publish reaches all of them.
  - Delivery is best effort: failures are counted and logged, never
    reported to the publisher.
  - Holds no business state. Constructed by the composition root and
    shut down explicitly before the server exits.
*/
class Notifier {
 public:
  explicit Notifier(util::NowFn now = util::Now);
  ~Notifier();

  Notifier(const Notifier&)            = delete;
  Notifier& operator=(const Notifier&) = delete;

  // InvalidArgument on an empty or duplicate connection id, InvalidState after Shutdown.
  void Register(const std::string& connection_id, const std::string& user_id, dispatch::core::v1::UserRole role,
                std::shared_ptr<EventSink> sink);

  // Returns the closed connection; nullopt for unknown ids.
  std::optional<LiveConnection> Unregister(const std::string& connection_id);

  // Returns the number of connections the event was delivered to.
  std::size_t Publish(const std::string& user_id, const dispatch::events::v1::TripEvent& event);

  // Closes every sink and refuses new registrations.
  void Shutdown();

  std::size_t ConnectionCount() const;
  std::size_t ConnectionCount(const std::string& user_id) const;

  std::optional<LiveConnection> Connection(const std::string& connection_id) const;

 private:
  struct Entry {
    LiveConnection             info;
    std::shared_ptr<EventSink> sink;
  };

  util::NowFn now_;

  mutable std::mutex                                               mutex_;
  std::unordered_map<std::string, Entry>                           connections_;
  std::unordered_map<std::string, std::unordered_set<std::string>> by_user_;
  bool                                                             shutdown_ = false;
};

} // namespace dispatch::notify
