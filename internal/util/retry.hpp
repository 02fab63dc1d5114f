#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <thread>

#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::util {

struct RetryPolicy {
  uint32_t                  max_attempts = 4;
  std::chrono::milliseconds initial_backoff{10};
  std::chrono::milliseconds max_backoff{200};
};

/*
  Replays fn while it fails with db::TransactionConflict.

  fn must be a complete unit of work (begin .. commit) so a replay sees
  fresh state. After max_attempts the conflict surfaces as StoreConflict.
*/
template <typename Fn>
auto RetryOnConflict(const RetryPolicy& policy, std::string_view operation, Fn&& fn) {
  static thread_local std::mt19937 rng{std::random_device{}()};

  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  auto           backoff  = policy.initial_backoff;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const db::TransactionConflict& e) {
      if (attempt >= attempts) {
        throw StoreConflict(std::string(operation) + ": gave up after " + std::to_string(attempt) + " attempts: " + e.what());
      }

      DISPATCH_LOG_WARN("store conflict; retrying", {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                                                     observability::StringField("error", e.what())});

      std::uniform_int_distribution<int64_t> jitter(0, std::max<int64_t>(backoff.count() / 2, 0));
      std::this_thread::sleep_for(backoff + std::chrono::milliseconds(jitter(rng)));
      backoff = std::min(backoff * 2, policy.max_backoff);
    }
  }
}

} // namespace dispatch::util
