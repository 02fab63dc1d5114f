#pragma once

#include "dispatch/core/v1/types.pb.h"

#include "dispatch/events/v1/events.pb.h"

#include "dispatch/services/v1/admin_service.pb.h"
#include "dispatch/services/v1/dispatch_service.pb.h"
#include "dispatch/services/v1/event_service.pb.h"
#include "dispatch/services/v1/tracking_service.pb.h"
#include "dispatch/services/v1/trip_service.pb.h"

#include "dispatch/services/v1/admin_service.grpc.pb.h"
#include "dispatch/services/v1/dispatch_service.grpc.pb.h"
#include "dispatch/services/v1/event_service.grpc.pb.h"
#include "dispatch/services/v1/tracking_service.grpc.pb.h"
#include "dispatch/services/v1/trip_service.grpc.pb.h"

namespace dispatch::v1 {
using namespace ::dispatch::core::v1;
using namespace ::dispatch::events::v1;
using namespace ::dispatch::services::v1;
}
