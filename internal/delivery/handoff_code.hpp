#pragma once

#include <string>
#include <string_view>

namespace dispatch::delivery {

/*
  Handoff codes for delivery trips.

  Two codes are issued when a delivery is created: the sender reads the
  pickup code to the worker, the recipient reads the delivery code at
  drop-off. Format is XXX-XXX-XXX over an alphabet without 0, O, 1
  and I. Codes are compared per trip, so they need not be globally
  unique.
*/

std::string NewHandoffCode();

bool IsWellFormedHandoffCode(std::string_view code);

// InvalidArgument when provided is malformed, HandoffCodeMismatch when it differs.
void VerifyHandoffCode(std::string_view expected, std::string_view provided, std::string_view which);

} // namespace dispatch::delivery
