#include "internal/observability/telemetry.hpp"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace {

using dispatch::config::ConfigLoader;
using dispatch::observability::ResolveOtlpEndpoint;
using dispatch::observability::ResourceFromConfig;
using dispatch::runtime::config::ObservabilityConfig;

std::string Label(const dispatch::observability::TelemetryResource& resource, const std::string& key) {
  for (const auto& [k, v] : resource.Labels()) {
    if (k == key) {
      return v;
    }
  }
  return {};
}

void TestResourceCarriesDeploymentLabels() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "/tmp/dispatch.db"
observability:
  environment: staging
  region: eu-west
)");

  auto resource = ResourceFromConfig(config);
  assert(resource.store_backend == "sqlite");
  assert(Label(resource, "service.name") == "dispatch-server");
  assert(Label(resource, "deployment.environment") == "staging");
  assert(Label(resource, "dispatch.region") == "eu-west");
  assert(Label(resource, "dispatch.store") == "sqlite");
}

void TestResourceDefaults() {
  auto resource = ResourceFromConfig(ConfigLoader::LoadFromYamlString(""));
  assert(resource.store_backend == "memory");
  // unset labels are not exported as empty strings
  assert(resource.Labels().size() == 2);
  assert(Label(resource, "deployment.environment").empty());

  auto postgres = ResourceFromConfig(ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://dispatch@localhost/dispatch"
)"));
  assert(postgres.store_backend == "postgres");
}

void TestEndpointPerSignal() {
  ObservabilityConfig grpc;
  grpc.set_otlp_endpoint("collector:4317");
  assert(ResolveOtlpEndpoint(grpc, "traces") == "collector:4317");
  assert(ResolveOtlpEndpoint(grpc, "metrics") == "collector:4317");

  ObservabilityConfig http;
  http.set_transport(dispatch::runtime::config::OTLP_TRANSPORT_HTTP);
  http.set_otlp_endpoint("http://collector:4318/");
  assert(ResolveOtlpEndpoint(http, "traces") == "http://collector:4318/v1/traces");
  assert(ResolveOtlpEndpoint(http, "metrics") == "http://collector:4318/v1/metrics");

  http.set_otlp_endpoint("http://collector:4318/v1/metrics");
  assert(ResolveOtlpEndpoint(http, "metrics") == "http://collector:4318/v1/metrics");
}

void TestEndpointFromEnvironment() {
  ObservabilityConfig http;
  http.set_transport(dispatch::runtime::config::OTLP_TRANSPORT_HTTP);

  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://env-collector:4318", 1);
  assert(ResolveOtlpEndpoint(http, "traces") == "http://env-collector:4318/v1/traces");

  ::setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces-only:9999/ingest", 1);
  assert(ResolveOtlpEndpoint(http, "traces") == "http://traces-only:9999/ingest");
  assert(ResolveOtlpEndpoint(http, "metrics") == "http://env-collector:4318/v1/metrics");

  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  assert(ResolveOtlpEndpoint(http, "traces") == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpEndpoint(ObservabilityConfig{}, "traces") == "localhost:4317");
}

void TestInstrumentsAreSafeWithoutExporter() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!dispatch::observability::InitializeTelemetry(config));

  dispatch::observability::SpanScope span("dispatch.test");
  span.SetAttribute("trip.id", "trip-1");
  span.SetAttribute("dispatch.batch", static_cast<std::int64_t>(2));
  span.RecordException("boom");

  auto& metrics = dispatch::observability::Metrics::Instance();
  metrics.RecordRequest("TripService.RateTrip", true);
  metrics.RecordDispatchOutcome(dispatch::observability::DispatchOutcome::kNoMatch, dispatch::core::v1::SERVICE_TYPE_DELIVERY);
  metrics.RecordOffersIssued(3, 1);
  assert(dispatch::observability::DispatchOutcomeName(dispatch::observability::DispatchOutcome::kNoMatch) == "no_match");

  dispatch::observability::ShutdownTelemetry();
}

} // namespace

int main() {
  TestResourceCarriesDeploymentLabels();
  TestResourceDefaults();
  TestEndpointPerSignal();
  TestEndpointFromEnvironment();
  TestInstrumentsAreSafeWithoutExporter();

  std::cout << "dispatch_unit_telemetry: pass\n";
  return 0;
}
