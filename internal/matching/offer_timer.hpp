#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"

namespace dispatch::matching {

/*
  Fires a callback per trip when its offer window closes.

  Deadlines live in memory only; the periodic dispatch sweep covers
  whatever a restart loses.
*/
class OfferTimer {
 public:
  using FireFn = std::function<void(const std::string& trip_id)>;

  explicit OfferTimer(FireFn fire);
  ~OfferTimer();

  OfferTimer(const OfferTimer&)            = delete;
  OfferTimer& operator=(const OfferTimer&) = delete;

  void Start();
  void Stop();

  void Schedule(const std::string& trip_id, util::TimePoint deadline);

  std::size_t Pending() const;

 private:
  struct Deadline {
    util::TimePoint at;
    std::string     trip_id;

    bool operator>(const Deadline& other) const {
      return at > other.at;
    }
  };

  void Run();

  FireFn fire_;

  mutable std::mutex                                                         mutex_;
  std::condition_variable                                                    cv_;
  std::priority_queue<Deadline, std::vector<Deadline>, std::greater<Deadline>> queue_;
  bool                                                                       stop_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace dispatch::matching
