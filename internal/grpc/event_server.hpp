#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/event_service.grpc.pb.h"
#include "internal/service/event_service.hpp"

namespace dispatch::grpc {

class EventServer final : public dispatch::services::v1::EventService::Service {
 public:
  explicit EventServer(std::shared_ptr<dispatch::service::EventService> svc);

  ::grpc::Status Subscribe(::grpc::ServerContext* context, const dispatch::services::v1::SubscribeRequest* req,
                           ::grpc::ServerWriter<dispatch::events::v1::TripEvent>* writer) override;

 private:
  std::shared_ptr<dispatch::service::EventService> service_;
};

} // namespace dispatch::grpc
