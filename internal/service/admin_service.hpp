#pragma once

#include "api/dispatch/v1.hpp"
#include "internal/core/caller.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  dispatch::v1::UpsertWorkerResponse UpsertWorker(const core::Caller& caller, const dispatch::v1::UpsertWorkerRequest& req);

  dispatch::v1::PostCreditResponse PostCredit(const core::Caller& caller, const dispatch::v1::PostCreditRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
