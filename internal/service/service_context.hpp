#pragma once

#include <memory>

namespace dispatch::core {
class TripManager;
}
namespace dispatch::db {
class Repository;
}
namespace dispatch::location {
class LocationRegistry;
}
namespace dispatch::notify {
class Notifier;
}
namespace dispatch::payment {
class HoldCoordinator;
}

namespace dispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dispatch::core::TripManager>          manager;
  std::shared_ptr<dispatch::payment::HoldCoordinator>   holds;
  std::shared_ptr<dispatch::location::LocationRegistry> registry;
  std::shared_ptr<dispatch::notify::Notifier>           notifier;
  std::shared_ptr<dispatch::db::Repository>             repository;
};

} // namespace dispatch::service
