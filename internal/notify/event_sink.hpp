#pragma once

#include "dispatch/events/v1/events.pb.h"

namespace dispatch::notify {

/*
  Delivery end of one live connection.

  Deliver must not block; it returns false when the event was dropped
  (connection closed or its buffer full).
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual bool Deliver(const dispatch::events::v1::TripEvent& event) = 0;

  // Wakes any reader; later Deliver calls fail.
  virtual void Close() = 0;
};

} // namespace dispatch::notify
