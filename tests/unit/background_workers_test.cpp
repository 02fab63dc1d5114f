#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/matching/offer_timer.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/time.hpp"

namespace {

using dispatch::matching::OfferTimer;
using dispatch::runtime::PeriodicTask;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

void TestPeriodicTaskRunsUntilStopped() {
  std::atomic<int> runs{0};
  PeriodicTask     task("counter", std::chrono::milliseconds(5), [&] { ++runs; });
  assert(task.Name() == "counter");

  task.Start();
  // second start is a no-op
  task.Start();
  assert(WaitFor([&] { return runs.load() >= 3; }));

  task.Stop();
  const int after_stop = runs.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(runs.load() == after_stop);

  // idempotent
  task.Stop();
}

void TestPeriodicTaskSurvivesFailures() {
  std::atomic<int> calls{0};
  PeriodicTask     task("flaky", std::chrono::milliseconds(5), [&] {
    if (++calls == 1) {
      throw std::runtime_error("store unavailable");
    }
  });

  task.Start();
  assert(WaitFor([&] { return calls.load() >= 3; }));
  task.Stop();
}

void TestPeriodicTaskStopIsPrompt() {
  PeriodicTask task("slow", std::chrono::hours(1), [] {});
  task.Start();

  const auto begin = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
}

void TestOfferTimerFiresInDeadlineOrder() {
  std::mutex               mutex;
  std::vector<std::string> fired;
  OfferTimer               timer([&](const std::string& trip_id) {
    std::lock_guard lock(mutex);
    fired.push_back(trip_id);
  });

  const auto now = dispatch::util::Clock::now();
  timer.Schedule("trip-late", now + std::chrono::milliseconds(80));
  timer.Schedule("trip-early", now + std::chrono::milliseconds(20));
  assert(timer.Pending() == 2);

  timer.Start();
  assert(WaitFor([&] {
    std::lock_guard lock(mutex);
    return fired.size() == 2;
  }));
  timer.Stop();

  assert(fired[0] == "trip-early");
  assert(fired[1] == "trip-late");
  assert(timer.Pending() == 0);
}

void TestOfferTimerPastDeadlineFiresImmediately() {
  std::atomic<int> fired{0};
  OfferTimer       timer([&](const std::string&) { ++fired; });
  timer.Start();

  timer.Schedule("trip-1", dispatch::util::Clock::now() - std::chrono::seconds(1));
  assert(WaitFor([&] { return fired.load() == 1; }, std::chrono::seconds(2)));
}

void TestOfferTimerSurvivesHandlerFailure() {
  std::atomic<int> calls{0};
  OfferTimer       timer([&](const std::string& trip_id) {
    ++calls;
    if (trip_id == "trip-bad") {
      throw std::runtime_error("reconcile failed");
    }
  });
  timer.Start();

  const auto now = dispatch::util::Clock::now();
  timer.Schedule("trip-bad", now);
  timer.Schedule("trip-good", now + std::chrono::milliseconds(10));
  assert(WaitFor([&] { return calls.load() == 2; }));
}

void TestOfferTimerStopLeavesFutureDeadlines() {
  std::atomic<int> fired{0};
  OfferTimer       timer([&](const std::string&) { ++fired; });
  timer.Start();
  timer.Schedule("trip-1", dispatch::util::Clock::now() + std::chrono::hours(1));

  const auto begin = std::chrono::steady_clock::now();
  timer.Stop();
  assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
  assert(fired.load() == 0);
  assert(timer.Pending() == 1);
}

} // namespace

int main() {
  TestPeriodicTaskRunsUntilStopped();
  TestPeriodicTaskSurvivesFailures();
  TestPeriodicTaskStopIsPrompt();
  TestOfferTimerFiresInDeadlineOrder();
  TestOfferTimerPastDeadlineFiresImmediately();
  TestOfferTimerSurvivesHandlerFailure();
  TestOfferTimerStopLeavesFutureDeadlines();

  std::cout << "dispatch_unit_background_workers: pass\n";
  return 0;
}
