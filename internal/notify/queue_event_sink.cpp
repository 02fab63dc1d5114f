#include "internal/notify/queue_event_sink.hpp"

namespace dispatch::notify {

QueueEventSink::QueueEventSink(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool QueueEventSink::Deliver(const dispatch::events::v1::TripEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_ || queue_.size() >= capacity_) {
      return false;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

void QueueEventSink::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::optional<dispatch::events::v1::TripEvent> QueueEventSink::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }

  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

bool QueueEventSink::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t QueueEventSink::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace dispatch::notify
