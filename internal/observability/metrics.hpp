#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::observability {

enum class DispatchOutcome {
  kMatched,
  kNoMatch,
  kCancelled,
};

std::string_view DispatchOutcomeName(DispatchOutcome outcome);

/*
  Process-wide dispatch instruments. Calls are no-ops until
  InitializeTelemetry installs a meter provider.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // route is "Service.Method"
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordDispatchOutcome(DispatchOutcome outcome, dispatch::core::v1::ServiceType service);
  void RecordOffersIssued(std::uint64_t count, std::uint32_t batch_number);
  void ObserveTimeToMatchMs(double latency_ms, dispatch::core::v1::ServiceType service);
  void RecordNotification(bool delivered);
  void SetLiveConnections(std::int64_t count);

  // Recreates the instruments on the current provider. Called by
  // InstallMeter before serving starts.
  void Rebind();

 private:
  Metrics();
  ~Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace dispatch::observability
