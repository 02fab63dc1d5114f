#include "internal/grpc/caller_identity.hpp"

#include <string>

namespace dispatch::grpc {

namespace {

std::string Header(const ::grpc::ServerContext& context, std::string_view key) {
  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find(::grpc::string_ref(key.data(), key.size()));
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace

dispatch::core::v1::UserRole ParseRole(std::string_view value) {
  using namespace dispatch::core::v1;
  if (value == "requester") {
    return USER_ROLE_REQUESTER;
  }
  if (value == "worker") {
    return USER_ROLE_WORKER;
  }
  if (value == "admin") {
    return USER_ROLE_ADMIN;
  }
  return USER_ROLE_UNSPECIFIED;
}

core::Caller CallerFromContext(const ::grpc::ServerContext& context) {
  core::Caller caller;
  caller.user_id = Header(context, kUserIdHeader);
  caller.role    = ParseRole(Header(context, kUserRoleHeader));
  return caller;
}

} // namespace dispatch::grpc
