#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"

namespace dispatch::db {
class Repository;
}
namespace dispatch::matching {
class OfferTimer;
}
namespace dispatch::notify {
class Notifier;
}
namespace dispatch::runtime {
class PeriodicTask;
}

namespace dispatch::factory {

/*
  Everything the server process owns for its lifetime.

  NOTE:
  Build() is the composition root. It is the ONLY place that knows
  concrete repository types.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<notify::Notifier>   notifier;
  std::shared_ptr<matching::OfferTimer> offer_timer;

  // dispatch sweep, scheduled trigger, location pruning
  std::vector<std::shared_ptr<runtime::PeriodicTask>> background_tasks;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

std::shared_ptr<db::Repository> BuildRepository(const dispatch::runtime::config::RuntimeConfig& config);

// Builds the dependency graph and starts the background workers.
Application Build(const dispatch::runtime::config::RuntimeConfig& config);

// Stops background work and closes live connections. Idempotent.
void Shutdown(Application& app);

} // namespace dispatch::factory
