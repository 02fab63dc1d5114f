#pragma once

#include <string>

#include "dispatch/core/v1/types.pb.h"
#include "internal/util/errors.hpp"

namespace dispatch::core {

// Identity asserted by the trusted identity layer for one call.
struct Caller {
  std::string                  user_id;
  dispatch::core::v1::UserRole role = dispatch::core::v1::USER_ROLE_UNSPECIFIED;

  bool IsAdmin() const {
    return role == dispatch::core::v1::USER_ROLE_ADMIN;
  }
};

inline void RequireIdentity(const Caller& caller) {
  if (caller.user_id.empty() || caller.role == dispatch::core::v1::USER_ROLE_UNSPECIFIED) {
    throw util::Unauthenticated("caller identity is required");
  }
}

inline void RequireRole(const Caller& caller, dispatch::core::v1::UserRole role) {
  RequireIdentity(caller);
  if (caller.role != role) {
    throw util::PermissionDenied("operation requires role " + dispatch::core::v1::UserRole_Name(role));
  }
}

} // namespace dispatch::core
