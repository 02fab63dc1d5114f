#pragma once

#include <string_view>

#include <grpcpp/grpcpp.h>

#include "internal/core/caller.hpp"

namespace dispatch::grpc {

inline constexpr std::string_view kUserIdHeader   = "x-user-id";
inline constexpr std::string_view kUserRoleHeader = "x-user-role";

// Reads the identity attached by the trusted identity layer. Missing
// headers leave the caller empty; services reject it as unauthenticated.
core::Caller CallerFromContext(const ::grpc::ServerContext& context);

// "requester" | "worker" | "admin"; anything else is unspecified.
dispatch::core::v1::UserRole ParseRole(std::string_view value);

} // namespace dispatch::grpc
