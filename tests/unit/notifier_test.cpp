#include "internal/notify/notifier.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/notify/events.hpp"
#include "internal/notify/queue_event_sink.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::events::v1::EVENT_TYPE_OFFER_CREATED;
using dispatch::events::v1::EVENT_TYPE_TRIP_ASSIGNED;
using dispatch::events::v1::EVENT_TYPE_WORKER_LOCATION;
using dispatch::events::v1::TripEvent;
using dispatch::notify::Notifier;
using dispatch::notify::QueueEventSink;
using dispatch::testing::ManualClock;
using dispatch::testing::RecordingSink;
using dispatch::testing::Throws;

class ThrowingSink final : public dispatch::notify::EventSink {
 public:
  bool Deliver(const TripEvent&) override {
    throw std::runtime_error("socket reset");
  }

  void Close() override {
  }
};

TripEvent AssignedEvent(const ManualClock& clock) {
  dispatch::db::model::TripRecord trip;
  trip.id           = "trip-1";
  trip.requester_id = "rider-1";
  trip.worker_id    = "driver-1";
  trip.status       = TRIP_STATUS_ASSIGNED;
  return dispatch::notify::MakeTripEvent(EVENT_TYPE_TRIP_ASSIGNED, trip, clock.Now());
}

void TestEventConstructors() {
  ManualClock clock;

  auto trip_event = AssignedEvent(clock);
  assert(!trip_event.event_id().empty());
  assert(trip_event.trip_id() == "trip-1");
  assert(trip_event.has_trip());
  assert(trip_event.trip().worker_id() == "driver-1");
  assert(trip_event.at().seconds() == static_cast<int64_t>(clock.NowMs() / 1000));

  dispatch::db::model::OfferRecord offer;
  offer.id           = "offer-1";
  offer.trip_id      = "trip-1";
  offer.worker_id    = "driver-2";
  offer.status       = OFFER_STATUS_PENDING;
  offer.batch_number = 2;
  auto offer_event   = dispatch::notify::MakeOfferEvent(EVENT_TYPE_OFFER_CREATED, offer, clock.Now(), "because");
  assert(offer_event.has_offer());
  assert(offer_event.offer().batch_number() == 2);
  assert(offer_event.reason() == "because");
  assert(offer_event.event_id() != trip_event.event_id());

  dispatch::db::model::WorkerLocationRecord location;
  location.worker_id = "driver-1";
  location.lat       = 10;
  location.lng       = 20;
  auto location_event = dispatch::notify::MakeLocationEvent("trip-1", location, clock.Now());
  assert(location_event.type() == EVENT_TYPE_WORKER_LOCATION);
  assert(location_event.location().point().lat() == 10);
}

void TestPublishReachesEveryConnectionOfUser() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());

  auto phone  = std::make_shared<RecordingSink>();
  auto tablet = std::make_shared<RecordingSink>();
  auto other  = std::make_shared<RecordingSink>();
  notifier.Register("c-phone", "rider-1", USER_ROLE_REQUESTER, phone);
  notifier.Register("c-tablet", "rider-1", USER_ROLE_REQUESTER, tablet);
  notifier.Register("c-other", "rider-2", USER_ROLE_REQUESTER, other);

  assert(notifier.ConnectionCount() == 3);
  assert(notifier.ConnectionCount("rider-1") == 2);

  assert(notifier.Publish("rider-1", AssignedEvent(clock)) == 2);
  assert(phone->Events().size() == 1);
  assert(tablet->Events().size() == 1);
  assert(other->Events().empty());
}

void TestPublishToOfflineUserIsNoop() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());
  assert(notifier.Publish("nobody", AssignedEvent(clock)) == 0);
}

void TestFailingSinkDoesNotAffectOthers() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());

  auto good = std::make_shared<RecordingSink>();
  notifier.Register("c-bad", "driver-1", USER_ROLE_WORKER, std::make_shared<ThrowingSink>());
  notifier.Register("c-good", "driver-1", USER_ROLE_WORKER, good);

  assert(notifier.Publish("driver-1", AssignedEvent(clock)) == 1);
  assert(good->Events().size() == 1);
}

void TestConnectionBookkeeping() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());

  auto sink = std::make_shared<RecordingSink>();
  notifier.Register("c-1", "driver-1", USER_ROLE_WORKER, sink);

  auto info = notifier.Connection("c-1");
  assert(info && info->connected);
  assert(info->role == USER_ROLE_WORKER);
  assert(info->connected_at_ms == clock.NowMs());

  clock.Advance(std::chrono::seconds(3));
  notifier.Publish("driver-1", AssignedEvent(clock));
  assert(notifier.Connection("c-1")->last_activity_ms == clock.NowMs());

  clock.Advance(std::chrono::seconds(2));
  auto closed = notifier.Unregister("c-1");
  assert(closed && !closed->connected);
  assert(closed->disconnected_at_ms == clock.NowMs());
  assert(sink->IsClosed());
  assert(notifier.ConnectionCount("driver-1") == 0);
  assert(!notifier.Connection("c-1"));
  assert(!notifier.Unregister("c-1"));
}

void TestRegisterValidation() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());
  auto        sink = std::make_shared<RecordingSink>();

  assert(Throws<dispatch::util::InvalidArgument>([&] { notifier.Register("", "u", USER_ROLE_WORKER, sink); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { notifier.Register("c", "", USER_ROLE_WORKER, sink); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { notifier.Register("c", "u", USER_ROLE_WORKER, nullptr); }));

  notifier.Register("c", "u", USER_ROLE_WORKER, sink);
  assert(Throws<dispatch::util::InvalidArgument>([&] { notifier.Register("c", "u", USER_ROLE_WORKER, sink); }));
}

void TestShutdownClosesAndRefuses() {
  ManualClock clock;
  Notifier    notifier(clock.Fn());

  auto a = std::make_shared<RecordingSink>();
  auto b = std::make_shared<RecordingSink>();
  notifier.Register("c-a", "rider-1", USER_ROLE_REQUESTER, a);
  notifier.Register("c-b", "driver-1", USER_ROLE_WORKER, b);

  notifier.Shutdown();
  assert(a->IsClosed() && b->IsClosed());
  assert(notifier.ConnectionCount() == 0);
  assert(notifier.Publish("rider-1", AssignedEvent(clock)) == 0);
  assert(Throws<dispatch::util::InvalidState>([&] { notifier.Register("c-c", "rider-1", USER_ROLE_REQUESTER, a); }));

  // idempotent
  notifier.Shutdown();
}

void TestQueueSinkBoundsAndOrder() {
  ManualClock    clock;
  QueueEventSink sink(2);

  auto first  = AssignedEvent(clock);
  auto second = AssignedEvent(clock);
  assert(sink.Deliver(first));
  assert(sink.Deliver(second));
  assert(!sink.Deliver(AssignedEvent(clock)));
  assert(sink.Size() == 2);

  auto got = sink.Next(std::chrono::milliseconds(0));
  assert(got && got->event_id() == first.event_id());
  got = sink.Next(std::chrono::milliseconds(0));
  assert(got && got->event_id() == second.event_id());
  assert(!sink.Next(std::chrono::milliseconds(5)));
}

void TestQueueSinkCloseWakesReader() {
  ManualClock    clock;
  QueueEventSink sink;
  sink.Deliver(AssignedEvent(clock));
  sink.Close();

  assert(sink.IsClosed());
  assert(!sink.Deliver(AssignedEvent(clock)));
  // buffered events drain after close
  assert(sink.Next(std::chrono::milliseconds(0)));
  assert(!sink.Next(std::chrono::seconds(5)));
}

void TestQueueSinkBlockingNext() {
  ManualClock    clock;
  QueueEventSink sink;

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sink.Deliver(AssignedEvent(clock));
  });

  auto got = sink.Next(std::chrono::seconds(5));
  producer.join();
  assert(got.has_value());
}

} // namespace

int main() {
  TestEventConstructors();
  TestPublishReachesEveryConnectionOfUser();
  TestPublishToOfflineUserIsNoop();
  TestFailingSinkDoesNotAffectOthers();
  TestConnectionBookkeeping();
  TestRegisterValidation();
  TestShutdownClosesAndRefuses();
  TestQueueSinkBoundsAndOrder();
  TestQueueSinkCloseWakesReader();
  TestQueueSinkBlockingNext();

  std::cout << "dispatch_unit_notifier: pass\n";
  return 0;
}
