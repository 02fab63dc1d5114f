#include "internal/runtime/periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&PeriodicTask::Run, this);
  DISPATCH_LOG_INFO("background task started", {observability::StringField("task", name_), observability::IntField("interval_ms", interval_.count())});
}

void PeriodicTask::Stop() {
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

void PeriodicTask::Run() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return stop_; })) {
        return;
      }
    }

    try {
      fn_();
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("background task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace dispatch::runtime
