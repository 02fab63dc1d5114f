#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

using namespace dispatch::core::v1;
using dispatch::config::ConfigLoader;
using dispatch::config::LoadSettings;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dispatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool ThrowsRuntimeError(const std::string& yaml) {
  bool threw = false;
  try {
    LoadSettings(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  return threw;
}

void TestFullFileLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/dispatch/dispatch.db"
    wal_mode: true
logging:
  level: debug
  file: "/var/log/dispatch/dispatch.log"
  max_file_size_bytes: 1048576
  max_files: 3
dispatch:
  offer_window: 15s
  batch_size: 3
  initial_radius_km: 2
  radius_multiplier: 2
  max_radius_km: 8
  max_escalations: 2
  max_batches: 4
  sweep_interval: 0.5s
location:
  liveness_window: 120s
  retention: 3600s
fares:
  - service_type: SERVICE_TYPE_PREMIUM
    base_fare: 700
    per_km: 250
    per_minute: 50
    minimum_fare: 1500
    currency: EUR
scheduling:
  poll_interval: 30s
tips:
  min_amount: 100
  max_amount: 10000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/dispatch/dispatch.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "/var/log/dispatch/dispatch.log");
  assert(config.logging().max_file_size_bytes() == 1048576);
  assert(config.logging().max_files() == 3);

  auto settings = LoadSettings(config);
  assert(settings.dispatch.offer_window == std::chrono::seconds(15));
  assert(settings.dispatch.batch_size == 3);
  assert(settings.dispatch.initial_radius_km == 2.0);
  assert(settings.dispatch.radius_multiplier == 2.0);
  assert(settings.dispatch.max_radius_km == 8.0);
  assert(settings.dispatch.max_escalations == 2);
  assert(settings.dispatch.max_batches == 4);
  assert(settings.dispatch.sweep_interval == std::chrono::milliseconds(500));
  assert(settings.location.liveness_window == std::chrono::minutes(2));
  assert(settings.location.retention == std::chrono::hours(1));
  assert(settings.schedule_poll_interval == std::chrono::seconds(30));
  assert(settings.tips.min_amount == 100 && settings.tips.max_amount == 10000);

  const auto& premium = settings.FareFor(SERVICE_TYPE_PREMIUM);
  assert(premium.base_fare == 700 && premium.minimum_fare == 1500 && premium.currency == "EUR");
  // untouched services keep the built-in schedule
  assert(settings.FareFor(SERVICE_TYPE_STANDARD).minimum_fare == 500);
}

void TestEmptyDocumentGivesDefaults() {
  auto settings = LoadSettings(ConfigLoader::LoadFromYamlString(""));
  assert(settings.dispatch.offer_window == std::chrono::seconds(20));
  assert(settings.dispatch.batch_size == 5);
  assert(settings.dispatch.max_batches == 8);
  assert(settings.dispatch.max_pending_offers_per_worker == 1);
  assert(settings.location.liveness_window == std::chrono::minutes(5));
  assert(settings.average_speed_kmh == 30.0);
  assert(settings.store_retry.max_attempts == 4);
  assert(settings.sharing.token_ttl == std::chrono::hours(24));
  assert(settings.fares.size() == 3);
  assert(settings.FareFor(SERVICE_TYPE_DELIVERY).per_km == 80);
}

void TestMemoryBackendSelection() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestQuotedScalarStaysString() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "12345"
    max_connections: 4
)");
  assert(config.database().postgres().connection_uri() == "12345");
  assert(config.database().postgres().max_connections() == 4);
}

void TestUnknownFieldRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(dispatch:
  offer_windw: 10s
)");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(threw);
}

void TestMissingFileRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/dispatch.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidValuesRejected() {
  assert(ThrowsRuntimeError(R"(dispatch:
  initial_radius_km: 20
  max_radius_km: 10
)"));
  assert(ThrowsRuntimeError(R"(dispatch:
  radius_multiplier: 0.5
)"));
  assert(ThrowsRuntimeError(R"(location:
  liveness_window: 600s
  retention: 60s
)"));
  assert(ThrowsRuntimeError(R"(fares:
  - base_fare: 100
)"));
  assert(ThrowsRuntimeError(R"(tips:
  min_amount: 500
  max_amount: 100
)"));
  assert(ThrowsRuntimeError(R"(observability:
  trace_sample_ratio: 1.5
)"));
  assert(ThrowsRuntimeError(R"(store_retry:
  initial_backoff: 1s
  max_backoff: 0.1s
)"));
}

void TestNonMappingTopLevelRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullFileLoads();
  TestEmptyDocumentGivesDefaults();
  TestMemoryBackendSelection();
  TestQuotedScalarStaysString();
  TestUnknownFieldRejected();
  TestMissingFileRejected();
  TestInvalidValuesRejected();
  TestNonMappingTopLevelRejected();

  std::cout << "dispatch_unit_config_loader: pass\n";
  return 0;
}
