#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace dispatch::runtime {

/*
  Runs fn every interval on its own thread until Stop().

  A failing run is logged and the next one happens on schedule.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace dispatch::runtime
