#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "api/dispatch/v1.hpp"

using namespace dispatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> <user_id> <role> <command> [args]\n"
            << "\n"
            << "  requester:\n"
            << "    estimate <plat> <plng> <dlat> <dlng> [service=standard|premium|delivery]\n"
            << "    request <plat> <plng> <dlat> <dlng> [service] [payment=wallet|card|cash]\n"
            << "    get <trip_id> [history]\n"
            << "    cancel <trip_id> [note]\n"
            << "    tip <trip_id> <amount>\n"
            << "    share <trip_id>\n"
            << "    revoke <trip_id>\n"
            << "    balance\n"
            << "  worker:\n"
            << "    offers\n"
            << "    accept <trip_id>\n"
            << "    decline <trip_id> [reason]\n"
            << "    locate <lat> <lng> [online=1] [available=1]\n"
            << "    status <trip_id> <arrived_pickup|in_progress|arrived_dropoff|completed> [final_fare] [code=XXX-XXX-XXX]\n"
            << "  admin:\n"
            << "    worker <worker_id> <services=standard,premium,...> [vehicle=car|motorcycle|bicycle|van] [max_active=1]\n"
            << "    credit <account_id> <amount> [currency=USD]\n"
            << "  any:\n"
            << "    watch\n"
            << "    rate <trip_id> <stars=1..5> [feedback]\n"
            << "    worker-rating <worker_id>\n"
            << "    track <token>\n";
}

static std::optional<ServiceType> ParseService(const std::string& value) {
  if (value == "standard") {
    return SERVICE_TYPE_STANDARD;
  }
  if (value == "premium") {
    return SERVICE_TYPE_PREMIUM;
  }
  if (value == "delivery") {
    return SERVICE_TYPE_DELIVERY;
  }
  return std::nullopt;
}

static std::optional<PaymentMethod> ParsePayment(const std::string& value) {
  if (value == "wallet") {
    return PAYMENT_METHOD_WALLET;
  }
  if (value == "card") {
    return PAYMENT_METHOD_CARD;
  }
  if (value == "cash") {
    return PAYMENT_METHOD_CASH;
  }
  return std::nullopt;
}

static std::optional<VehicleType> ParseVehicle(const std::string& value) {
  if (value == "car") return VEHICLE_TYPE_CAR;
  if (value == "motorcycle") return VEHICLE_TYPE_MOTORCYCLE;
  if (value == "bicycle") return VEHICLE_TYPE_BICYCLE;
  if (value == "van") return VEHICLE_TYPE_VAN;
  return std::nullopt;
}

static std::optional<TripStatus> ParseStatus(const std::string& value) {
  if (value == "arrived_pickup") return TRIP_STATUS_ARRIVED_PICKUP;
  if (value == "in_progress") return TRIP_STATUS_IN_PROGRESS;
  if (value == "arrived_dropoff") return TRIP_STATUS_ARRIVED_DROPOFF;
  if (value == "completed") return TRIP_STATUS_COMPLETED;
  return std::nullopt;
}

static Place MakePlace(const char* lat, const char* lng) {
  Place place;
  place.mutable_point()->set_lat(std::stod(lat));
  place.mutable_point()->set_lng(std::stod(lng));
  return place;
}

static ServiceType ServiceArg(int argc, char** argv, int index) {
  if (argc <= index) {
    return SERVICE_TYPE_STANDARD;
  }
  auto parsed = ParseService(argv[index]);
  if (!parsed.has_value()) {
    std::cerr << "unsupported service: " << argv[index] << "\n";
    std::exit(1);
  }
  return parsed.value();
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message();
  if (!status.error_details().empty()) {
    std::cerr << " (" << status.error_details() << ")";
  }
  std::cerr << "\n";
  return 2;
}

static void PrintTrip(const Trip& trip) {
  std::cout << "trip=" << trip.id() << " status=" << TripStatus_Name(trip.status()) << " fare=" << trip.estimated_fare() << " "
            << trip.currency();
  if (!trip.worker_id().empty()) {
    std::cout << " worker=" << trip.worker_id();
  }
  if (!trip.pickup_code().empty()) {
    std::cout << " pickup_code=" << trip.pickup_code() << " delivery_code=" << trip.delivery_code();
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 5) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string user_id = argv[2];
  std::string role    = argv[3];
  std::string cmd     = argv[4];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto trip_stub     = TripService::NewStub(channel);
  auto dispatch_stub = DispatchService::NewStub(channel);
  auto tracking_stub = TrackingService::NewStub(channel);
  auto event_stub    = EventService::NewStub(channel);
  auto admin_stub    = AdminService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-user-id", user_id);
  ctx.AddMetadata("x-user-role", role);

  // ------------------------------------------------------------

  if (cmd == "estimate" || cmd == "request") {
    if (argc < 9) return 1;

    if (cmd == "estimate") {
      EstimateFareRequest req;
      *req.mutable_pickup()  = MakePlace(argv[5], argv[6]);
      *req.mutable_dropoff() = MakePlace(argv[7], argv[8]);
      req.set_service_type(ServiceArg(argc, argv, 9));

      EstimateFareResponse resp;
      auto                 status = trip_stub->EstimateFare(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "fare=" << resp.fare().amount() << " " << resp.fare().currency() << " distance_km=" << resp.fare().distance_km()
                << " duration_min=" << resp.fare().duration_min() << "\n";
      return 0;
    }

    CreateTripRequest req;
    *req.mutable_pickup()  = MakePlace(argv[5], argv[6]);
    *req.mutable_dropoff() = MakePlace(argv[7], argv[8]);
    req.set_service_type(ServiceArg(argc, argv, 9));
    req.set_payment_method(PAYMENT_METHOD_WALLET);
    if (argc >= 11) {
      auto parsed = ParsePayment(argv[10]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported payment method: " << argv[10] << "\n";
        return 1;
      }
      req.set_payment_method(parsed.value());
    }

    CreateTripResponse resp;
    auto               status = trip_stub->CreateTrip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTrip(resp.trip());
    if (!resp.hold_id().empty()) {
      std::cout << "hold=" << resp.hold_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 6) return 1;

    GetTripRequest req;
    req.set_trip_id(argv[5]);
    req.set_include_history(argc >= 7 && std::string(argv[6]) == "history");

    GetTripResponse resp;
    auto            status = trip_stub->GetTrip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTrip(resp.trip());
    for (const auto& change : resp.history()) {
      std::cout << "  " << TripStatus_Name(change.from_status()) << " -> " << TripStatus_Name(change.to_status()) << " by "
                << change.actor_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 6) return 1;

    CancelTripRequest req;
    req.set_trip_id(argv[5]);
    if (argc >= 7) req.set_note(argv[6]);

    CancelTripResponse resp;
    auto               status = trip_stub->CancelTrip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTrip(resp.trip());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 7) return 1;

    auto parsed = ParseStatus(argv[6]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported status: " << argv[6] << "\n";
      return 1;
    }

    UpdateTripStatusRequest req;
    req.set_trip_id(argv[5]);
    req.set_status(parsed.value());
    for (int i = 7; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg.rfind("code=", 0) == 0) {
        req.set_handoff_code(arg.substr(5));
      } else {
        req.set_final_fare(std::stoll(arg));
      }
    }

    UpdateTripStatusResponse resp;
    auto                     status = trip_stub->UpdateTripStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTrip(resp.trip());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rate") {
    if (argc < 7) return 1;

    RateTripRequest req;
    req.set_trip_id(argv[5]);
    req.set_stars(static_cast<uint32_t>(std::stoul(argv[6])));
    if (argc >= 8) req.set_feedback(argv[7]);

    RateTripResponse resp;
    auto             status = trip_stub->RateTrip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rated " << req.stars();
    if (resp.has_worker_rating()) {
      std::cout << " worker=" << resp.worker_rating().worker_id() << " average=" << resp.worker_rating().average() << " ("
                << resp.worker_rating().count() << " ratings)";
    }
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "worker-rating") {
    if (argc < 6) return 1;

    GetWorkerRatingRequest req;
    req.set_worker_id(argv[5]);

    GetWorkerRatingResponse resp;
    auto                    status = trip_stub->GetWorkerRating(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "worker=" << resp.rating().worker_id() << " average=" << resp.rating().average() << " (" << resp.rating().count()
              << " ratings)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tip") {
    if (argc < 7) return 1;

    AddTipRequest req;
    req.set_trip_id(argv[5]);
    req.set_amount(std::stoll(argv[6]));

    AddTipResponse resp;
    auto           status = trip_stub->AddTip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "tipped " << resp.trip().tip_amount() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "share") {
    if (argc < 6) return 1;

    CreateShareLinkRequest req;
    req.set_trip_id(argv[5]);

    CreateShareLinkResponse resp;
    auto                    status = trip_stub->CreateShareLink(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "token=" << resp.token() << " expires_at=" << resp.expires_at().seconds() << "\n";
    return 0;
  }

  if (cmd == "revoke") {
    if (argc < 6) return 1;

    RevokeShareLinkRequest req;
    req.set_trip_id(argv[5]);

    RevokeShareLinkResponse resp;
    auto                    status = trip_stub->RevokeShareLink(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "revoked=" << resp.revoked() << "\n";
    return 0;
  }

  if (cmd == "track") {
    if (argc < 6) return 1;

    GetSharedTripRequest req;
    req.set_token(argv[5]);

    GetSharedTripResponse resp;
    auto                  status = tracking_stub->GetSharedTrip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << TripStatus_Name(resp.view().status());
    if (resp.view().has_worker_location()) {
      std::cout << " worker_at=" << resp.view().worker_location().point().lat() << "," << resp.view().worker_location().point().lng();
    }
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    GetBalanceRequest  req;
    GetBalanceResponse resp;
    auto               status = trip_stub->GetBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "available=" << resp.available() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "offers") {
    ListOffersRequest  req;
    ListOffersResponse resp;
    auto               status = dispatch_stub->ListOffers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& offer : resp.offers()) {
      std::cout << "trip=" << offer.trip_id() << " batch=" << offer.batch_number() << " distance_km=" << offer.distance_km()
                << " expires_at=" << offer.expires_at().seconds() << "\n";
    }
    return 0;
  }

  if (cmd == "accept" || cmd == "decline") {
    if (argc < 6) return 1;

    RespondToOfferRequest req;
    req.set_trip_id(argv[5]);
    req.set_decision(cmd == "accept" ? OFFER_DECISION_ACCEPT : OFFER_DECISION_DECLINE);
    if (argc >= 7) req.set_reason(argv[6]);

    RespondToOfferResponse resp;
    auto                   status = dispatch_stub->RespondToOffer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "offer=" << OfferStatus_Name(resp.offer().status()) << "\n";
    if (resp.has_trip()) PrintTrip(resp.trip());
    return 0;
  }

  if (cmd == "locate") {
    if (argc < 7) return 1;

    ReportLocationRequest req;
    req.mutable_point()->set_lat(std::stod(argv[5]));
    req.mutable_point()->set_lng(std::stod(argv[6]));
    req.set_online(argc < 8 || std::string(argv[7]) != "0");
    req.set_available(argc < 9 || std::string(argv[8]) != "0");

    ReportLocationResponse resp;
    auto                   status = dispatch_stub->ReportLocation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.persisted() ? "persisted\n" : "accepted (not persisted)\n");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "worker") {
    if (argc < 7) return 1;

    UpsertWorkerRequest req;
    req.set_worker_id(argv[5]);
    req.set_eligible(true);
    req.set_max_active_trips(argc >= 9 ? static_cast<uint32_t>(std::stoul(argv[8])) : 1);

    std::string services = argv[6];
    size_t      start    = 0;
    while (start <= services.size()) {
      auto end  = services.find(',', start);
      auto name = services.substr(start, end == std::string::npos ? std::string::npos : end - start);
      auto svc  = ParseService(name);
      if (!svc.has_value()) {
        std::cerr << "unsupported service: " << name << "\n";
        return 1;
      }
      req.add_services(svc.value());
      if (end == std::string::npos) break;
      start = end + 1;
    }

    req.set_vehicle_type(VEHICLE_TYPE_CAR);
    if (argc >= 8) {
      auto vehicle = ParseVehicle(argv[7]);
      if (!vehicle.has_value()) {
        std::cerr << "unsupported vehicle: " << argv[7] << "\n";
        return 1;
      }
      req.set_vehicle_type(vehicle.value());
    }

    UpsertWorkerResponse resp;
    auto                 status = admin_stub->UpsertWorker(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "worker registered\n";
    return 0;
  }

  if (cmd == "credit") {
    if (argc < 7) return 1;

    PostCreditRequest req;
    req.set_account_id(argv[5]);
    req.set_amount(std::stoll(argv[6]));
    req.set_currency(argc >= 8 ? argv[7] : "USD");

    PostCreditResponse resp;
    auto               status = admin_stub->PostCredit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "entry=" << resp.entry().id() << " available=" << resp.available() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    SubscribeRequest req;
    auto             reader = event_stub->Subscribe(&ctx, req);

    TripEvent event;
    while (reader->Read(&event)) {
      std::cout << EventType_Name(event.type()) << " trip=" << event.trip_id();
      if (event.has_trip()) {
        std::cout << " status=" << TripStatus_Name(event.trip().status());
      }
      std::cout << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
