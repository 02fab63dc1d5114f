#pragma once

#include <stdexcept>
#include <string>

namespace dispatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes plus a stable
  dispatch.core.v1.ErrorCode carried in the status details.
*/

class InsufficientFunds : public std::runtime_error {
 public:
  explicit InsufficientFunds(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ActiveTripConflict : public std::runtime_error {
 public:
  explicit ActiveTripConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoMatchFound : public std::runtime_error {
 public:
  explicit NoMatchFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OfferExpired : public std::runtime_error {
 public:
  explicit OfferExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyAssigned : public std::runtime_error {
 public:
  explicit AlreadyAssigned(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IneligibleWorker : public std::runtime_error {
 public:
  explicit IneligibleWorker(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic-concurrency retries were exhausted.
class StoreConflict : public std::runtime_error {
 public:
  explicit StoreConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UpstreamUnavailable : public std::runtime_error {
 public:
  explicit UpstreamUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A delivery pickup or drop-off code did not match.
class HandoffCodeMismatch : public std::runtime_error {
 public:
  explicit HandoffCodeMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dispatch::util
