#include "internal/service/admin_service.hpp"

#include "internal/db/api/result_check.hpp"
#include "internal/location/location_registry.hpp"
#include "internal/model/conversions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

namespace {

void RequireAdmin(const core::Caller& caller) {
  core::RequireRole(caller, USER_ROLE_ADMIN);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UpsertWorkerResponse AdminService::UpsertWorker(const core::Caller& caller, const UpsertWorkerRequest& req) {
  return ObserveRpc("AdminService.UpsertWorker", {}, [&] {
    RequireAdmin(caller);
    if (req.worker_id().empty()) {
      throw util::InvalidArgument("worker_id is required");
    }
    if (req.max_active_trips() == 0) {
      throw util::InvalidArgument("max_active_trips must be positive");
    }

    db::model::WorkerRecord worker;
    worker.id = req.worker_id();
    for (const auto service : req.services()) {
      if (service == SERVICE_TYPE_UNSPECIFIED) {
        continue;
      }
      worker.service_mask |= 1u << static_cast<uint32_t>(service);
    }
    worker.vehicle_type     = req.vehicle_type();
    worker.eligible         = req.eligible();
    worker.max_active_trips = req.max_active_trips();
    worker.updated_at_ms    = util::ToUnixMillis(util::Now());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertWorker(*tx, worker), "UpsertWorker");
    tx->Commit();

    ctx_.registry->RefreshWorker(worker);

    DISPATCH_LOG_INFO("Worker upserted", {observability::StringField("worker_id", worker.id), observability::BoolField("eligible", worker.eligible),
                                          observability::IntField("max_active_trips", worker.max_active_trips)});
    return UpsertWorkerResponse{};
  });
}

PostCreditResponse AdminService::PostCredit(const core::Caller& caller, const PostCreditRequest& req) {
  return ObserveRpc("AdminService.PostCredit", {}, [&] {
    RequireAdmin(caller);

    PostCreditResponse resp;
    auto               entry = ctx_.holds->PostCredit(req.account_id(), req.amount(), req.currency(), req.reference());
    *resp.mutable_entry()    = model::ToProto(entry);
    resp.set_available(ctx_.holds->AvailableBalance(req.account_id()));
    return resp;
  });
}

} // namespace dispatch::service
