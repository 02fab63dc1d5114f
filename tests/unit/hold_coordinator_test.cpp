#include "internal/payment/hold_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::payment::TripDraft;
using dispatch::testing::Harness;
using dispatch::testing::kDropoff;
using dispatch::testing::kPickup;
using dispatch::testing::Throws;

TripDraft Draft(const std::string& requester, int64_t fare, PaymentMethod payment = PAYMENT_METHOD_WALLET) {
  TripDraft draft;
  draft.requester_id   = requester;
  draft.pickup         = kPickup;
  draft.dropoff        = kDropoff;
  draft.service_type   = SERVICE_TYPE_STANDARD;
  draft.payment_method = payment;
  draft.estimated_fare = fare;
  draft.currency       = "USD";
  return draft;
}

void TestHoldReducesAvailableBalance() {
  Harness h;
  h.Credit("rider-1", 1000);

  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 500));
  assert(result.trip.status == TRIP_STATUS_SEARCHING);
  assert(!result.hold_id.empty());
  assert(result.trip.hold_id == result.hold_id);
  assert(h.Balance("rider-1") == 500);

  auto ledger = h.Ledger("rider-1");
  assert(ledger.size() == 2);
  assert(ledger[1].type == LEDGER_ENTRY_TYPE_HOLD);
  assert(ledger[1].amount == 500);
  assert(ledger[1].trip_id == result.trip.id);
  assert(ledger[1].reference == dispatch::payment::HoldReference(result.trip.id));
}

void TestInsufficientFundsCreatesNothing() {
  Harness h;
  h.Credit("rider-1", 400);

  assert(Throws<dispatch::util::InsufficientFunds>([&] { h.holds->CreateTripWithHold(Draft("rider-1", 500)); }));

  auto tx     = h.repository->Begin();
  auto active = h.repository->ListActiveTripsForRequester(*tx, "rider-1");
  tx->Commit();
  assert(active.empty());
  assert(h.Ledger("rider-1").size() == 1);
  assert(h.Balance("rider-1") == 400);
}

void TestCashSkipsHoldAndBalanceCheck() {
  Harness h;

  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 900, PAYMENT_METHOD_CASH));
  assert(result.hold_id.empty());
  assert(result.trip.hold_id.empty());
  assert(result.trip.status == TRIP_STATUS_SEARCHING);
  assert(h.Ledger("rider-1").empty());

  auto tx = h.repository->Begin();
  assert(!h.holds->ReleaseHold(*tx, result.trip));
  assert(!h.holds->SettleHold(*tx, result.trip, 900));
}

void TestSecondActiveTripRejected() {
  Harness h;
  h.Credit("rider-1", 5000);

  h.holds->CreateTripWithHold(Draft("rider-1", 500));
  assert(Throws<dispatch::util::ActiveTripConflict>([&] { h.holds->CreateTripWithHold(Draft("rider-1", 500)); }));
  assert(Throws<dispatch::util::ActiveTripConflict>([&] { h.holds->CreateTripWithHold(Draft("rider-1", 500, PAYMENT_METHOD_CASH)); }));
  assert(h.Balance("rider-1") == 4500);
}

void TestScheduledTripDoesNotCountAsActive() {
  Harness h;
  h.Credit("rider-1", 2000);

  auto scheduled            = Draft("rider-1", 500);
  scheduled.scheduled_at_ms = h.clock.NowMs() + 3'600'000;
  auto later                = h.holds->CreateTripWithHold(scheduled);
  assert(later.trip.status == TRIP_STATUS_SCHEDULED);
  assert(!later.hold_id.empty());

  auto now = h.holds->CreateTripWithHold(Draft("rider-1", 500));
  assert(now.trip.status == TRIP_STATUS_SEARCHING);
  assert(h.Balance("rider-1") == 1000);
}

void TestReleaseHoldRefundsOnce() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 500));

  {
    auto tx     = h.repository->Begin();
    auto refund = h.holds->ReleaseHold(*tx, result.trip);
    assert(refund);
    assert(refund->type == LEDGER_ENTRY_TYPE_REFUND);
    assert(refund->amount == 500);
    assert(refund->settles_entry_id == result.hold_id);
    tx->Commit();
  }
  assert(h.Balance("rider-1") == 1000);

  auto tx = h.repository->Begin();
  assert(!h.holds->ReleaseHold(*tx, result.trip));
  tx->Commit();
  assert(h.Balance("rider-1") == 1000);
}

void TestSettleHoldConvertsToDebit() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 500));

  {
    auto tx = h.repository->Begin();
    auto debit = h.holds->SettleHold(*tx, result.trip, 620);
    assert(debit && debit->type == LEDGER_ENTRY_TYPE_DEBIT);
    assert(debit->settles_entry_id == result.hold_id);
    tx->Commit();
  }
  // the debit replaces the hold; a fare above the estimate is still charged
  assert(h.Balance("rider-1") == 380);

  auto tx = h.repository->Begin();
  assert(Throws<dispatch::util::InvalidState>([&] { h.holds->SettleHold(*tx, result.trip, 620); }));
  assert(!h.holds->ReleaseHold(*tx, result.trip));
}

void TestSettleRejectsNonPositiveAmount() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 500));

  auto tx = h.repository->Begin();
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->SettleHold(*tx, result.trip, 0); }));
}

void TestTipMovesMoneyToWorker() {
  Harness h;
  h.Credit("rider-1", 1000);
  auto result = h.holds->CreateTripWithHold(Draft("rider-1", 500));

  auto trip      = result.trip;
  trip.worker_id = "driver-1";

  {
    auto tx = h.repository->Begin();
    h.holds->PostTip(*tx, trip, 200);
    tx->Commit();
  }
  assert(h.Balance("rider-1") == 300);
  assert(h.Balance("driver-1") == 200);

  auto tx = h.repository->Begin();
  assert(Throws<dispatch::util::InsufficientFunds>([&] { h.holds->PostTip(*tx, trip, 301); }));

  trip.worker_id.clear();
  assert(Throws<dispatch::util::InvalidState>([&] { h.holds->PostTip(*tx, trip, 10); }));
}

void TestPostCreditValidation() {
  Harness h;
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->PostCredit("", 100, "USD", "r"); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->PostCredit("rider-1", 0, "USD", "r"); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->PostCredit("rider-1", -5, "USD", "r"); }));

  auto entry = h.holds->PostCredit("rider-1", 250, "", "promo");
  assert(entry.currency == "USD");
  assert(entry.type == LEDGER_ENTRY_TYPE_CREDIT);
  assert(entry.reference == "promo");
  assert(h.Balance("rider-1") == 250);
}

void TestRejectsIncompleteDraft() {
  Harness h;
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->CreateTripWithHold(Draft("", 500)); }));
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.holds->CreateTripWithHold(Draft("rider-1", -1)); }));
}

void TestConcurrentRequestsKeepOneActiveTrip() {
  Harness h;
  h.Credit("rider-1", 10000);

  constexpr int    kThreads = 6;
  std::atomic<int> created{0};
  std::atomic<int> conflicts{0};
  std::atomic<int> exhausted{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        h.holds->CreateTripWithHold(Draft("rider-1", 500));
        ++created;
      } catch (const dispatch::util::ActiveTripConflict&) {
        ++conflicts;
      } catch (const dispatch::util::StoreConflict&) {
        ++exhausted;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  assert(created == 1);
  assert(created + conflicts + exhausted == kThreads);
  assert(h.Balance("rider-1") == 9500);
}

} // namespace

int main() {
  TestHoldReducesAvailableBalance();
  TestInsufficientFundsCreatesNothing();
  TestCashSkipsHoldAndBalanceCheck();
  TestSecondActiveTripRejected();
  TestScheduledTripDoesNotCountAsActive();
  TestReleaseHoldRefundsOnce();
  TestSettleHoldConvertsToDebit();
  TestSettleRejectsNonPositiveAmount();
  TestTipMovesMoneyToWorker();
  TestPostCreditValidation();
  TestRejectsIncompleteDraft();
  TestConcurrentRequestsKeepOneActiveTrip();

  std::cout << "dispatch_unit_hold_coordinator: pass\n";
  return 0;
}
