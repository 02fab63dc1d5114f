#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/notify/event_sink.hpp"

namespace dispatch::notify {

/*
  Bounded in-process buffer between Notifier::Publish and the
  stream writer of one subscription. Oldest events are kept; new ones
  are dropped once capacity is reached.
*/
class QueueEventSink final : public EventSink {
 public:
  explicit QueueEventSink(std::size_t capacity = 256);

  bool Deliver(const dispatch::events::v1::TripEvent& event) override;
  void Close() override;

  // Waits up to timeout. nullopt on timeout or once closed and drained.
  std::optional<dispatch::events::v1::TripEvent> Next(std::chrono::milliseconds timeout);

  bool        IsClosed() const;
  std::size_t Size() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::deque<dispatch::events::v1::TripEvent>    queue_;
  bool                                           closed_ = false;
};

} // namespace dispatch::notify
