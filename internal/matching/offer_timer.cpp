#include "internal/matching/offer_timer.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::matching {

OfferTimer::OfferTimer(FireFn fire) : fire_(std::move(fire)) {
}

OfferTimer::~OfferTimer() {
  Stop();
}

void OfferTimer::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&OfferTimer::Run, this);
}

void OfferTimer::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void OfferTimer::Schedule(const std::string& trip_id, util::TimePoint deadline) {
  {
    std::lock_guard lock(mutex_);
    queue_.push({deadline, trip_id});
  }
  cv_.notify_one();
}

std::size_t OfferTimer::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void OfferTimer::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    if (queue_.empty()) {
      cv_.wait(lock, [&] { return stop_ || !queue_.empty(); });
      continue;
    }

    const auto next = queue_.top().at;
    if (util::Clock::now() < next) {
      cv_.wait_until(lock, next);
      continue;
    }

    auto due = queue_.top();
    queue_.pop();

    lock.unlock();
    try {
      fire_(due.trip_id);
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("offer window handler failed", {observability::StringField("trip_id", due.trip_id), observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace dispatch::matching
